#pragma once

#include "tdma/common/SlotTypes.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tdma::agent {

using common::Slot;
using common::StationId;

/**
 * @brief Context handed to a station's decision source before it proposes slots.
 *
 * Stations later in the round see the tentative picks of earlier stations in
 * claimedSlots. previousFeedback is empty on the first round of a run.
 */
struct DecisionRequest {
    StationId station;
    int entitlement{0};
    int numSlots{0};
    int round{0};
    common::Demand demand;
    std::vector<std::pair<Slot, int>> heatRanking;
    std::map<Slot, int> conflictHistory;
    std::vector<Slot> claimedSlots;
    std::optional<common::Feedback> previousFeedback;

    nlohmann::json toJson() const;
};

class DecisionTimeout : public std::runtime_error {
public:
    explicit DecisionTimeout(const std::string& what) : std::runtime_error(what) {}
};

class DecisionSource {
public:
    virtual ~DecisionSource() = default;

    // Returns free-form text that is expected to embed a slot list; throws on
    // transport failure or when no reply arrives before the timeout.
    virtual std::string requestProposal(const DecisionRequest& request,
                                        std::chrono::milliseconds timeout) = 0;

    virtual std::string describe() const = 0;
};

}  // namespace tdma::agent
