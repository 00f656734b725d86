#pragma once

#include "tdma/agent/DecisionSource.h"

#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace tdma::agent {

struct HeuristicConfig {
    double noise{0.0};
    double malformedRate{0.0};
    std::optional<std::uint64_t> seed;
};

/**
 * @brief Offline stand-in for a chat-model agent.
 *
 * Proposes the coolest slots that earlier stations have not claimed this
 * round. With probability noise one pick is swapped for a random slot, and
 * with probability malformedRate the reply carries no parsable structure.
 * Well-formed replies alternate between strict JSON, single-quoted
 * pseudo-JSON and fenced blocks so the tolerant parser is exercised.
 */
class HeuristicDecisionSource : public DecisionSource {
public:
    explicit HeuristicDecisionSource(HeuristicConfig config);

    std::string requestProposal(const DecisionRequest& request,
                                std::chrono::milliseconds timeout) override;

    std::string describe() const override;

private:
    std::vector<Slot> choose(const DecisionRequest& request);
    std::string render(const std::vector<Slot>& slots, const DecisionRequest& request);
    bool roll(double probability);

    HeuristicConfig config_;
    std::mt19937_64 rng_;
};

}  // namespace tdma::agent
