#include "tdma/common/SlotTypes.h"

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace tdma::common {

namespace {

using json = nlohmann::json;

}  // namespace

json toJson(const Feedback& feedback) {
    json node;
    node["conflict_slots"] = feedback.conflictSlots;
    json details = json::object();
    for (const auto& [slot, stations] : feedback.conflictDetails) {
        details[std::to_string(slot)] = stations;
    }
    node["conflict_details"] = std::move(details);
    node["idle_slots"] = feedback.idleSlots;
    node["used_slots"] = feedback.usedSlots;
    node["utilization_rate"] = feedback.utilizationRate;
    return node;
}

json toJson(const SuccessRecord& record) {
    json node;
    node["demand"] = record.demand;
    node["allocation"] = record.allocation;
    node["rounds_to_success"] = record.roundsToSuccess;
    node["timestamp"] = record.timestamp;
    return node;
}

SuccessRecord successRecordFromJson(const json& node) {
    if (!node.is_object()) {
        throw std::runtime_error("Success record entry must be an object");
    }
    if (!node.contains("demand") || !node.contains("allocation")) {
        throw std::runtime_error("Success record missing demand or allocation");
    }

    SuccessRecord record;
    for (const auto& [station, value] : node.at("demand").items()) {
        record.demand[station] = value.get<int>();
    }
    for (const auto& [station, slots] : node.at("allocation").items()) {
        if (!slots.is_array()) {
            throw std::runtime_error("Success record allocation for '" + station + "' must be an array");
        }
        record.allocation[station] = slots.get<std::vector<Slot>>();
    }
    record.roundsToSuccess = node.value("rounds_to_success", 0);
    record.timestamp = node.value("timestamp", "");
    return record;
}

std::string formatSlots(const std::vector<Slot>& slots) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << slots[i];
    }
    oss << ']';
    return oss.str();
}

}  // namespace tdma::common
