#pragma once

#include "tdma/agent/DecisionSource.h"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace tdma::agent {

// Replays canned replies in order. Used for offline runs and tests.
class ScriptedDecisionSource : public DecisionSource {
public:
    explicit ScriptedDecisionSource(std::vector<std::string> replies);

    std::string requestProposal(const DecisionRequest& request,
                                std::chrono::milliseconds timeout) override;

    std::string describe() const override;

    std::size_t served() const noexcept { return next_; }
    std::size_t remaining() const noexcept { return replies_.size() - next_; }
    const std::vector<DecisionRequest>& requests() const noexcept { return requests_; }

private:
    std::vector<std::string> replies_;
    std::size_t next_{0};
    std::vector<DecisionRequest> requests_;
};

// Reads {"AP1": ["reply", ...], "AP2": [...]} from a JSON file.
std::map<StationId, std::vector<std::string>> loadScriptedReplies(const std::filesystem::path& path);

}  // namespace tdma::agent
