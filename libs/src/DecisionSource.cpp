#include "tdma/agent/DecisionSource.h"

namespace tdma::agent {

namespace {

using json = nlohmann::json;

}  // namespace

json DecisionRequest::toJson() const {
    json root;
    root["station"] = station;
    root["entitlement"] = entitlement;
    root["num_slots"] = numSlots;
    root["round"] = round;
    root["demand"] = demand;

    json ranking = json::array();
    for (const auto& [slot, heat] : heatRanking) {
        ranking.push_back(json::array({slot, heat}));
    }
    root["heat_ranking"] = std::move(ranking);

    json conflicts = json::object();
    for (const auto& [slot, count] : conflictHistory) {
        conflicts[std::to_string(slot)] = count;
    }
    root["conflict_history"] = std::move(conflicts);
    root["claimed_slots"] = claimedSlots;

    if (previousFeedback.has_value()) {
        root["feedback"] = common::toJson(*previousFeedback);
    } else {
        root["feedback"] = nullptr;
    }
    root["response_format"] = R"({"channels": [<slot indices>], "reason": "<text>"})";
    return root;
}

}  // namespace tdma::agent
