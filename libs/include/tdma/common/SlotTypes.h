#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace tdma::common {

using Slot = int;
using StationId = std::string;

using Demand = std::map<StationId, int>;
using ValidatedSet = std::vector<Slot>;
using Allocation = std::map<StationId, std::vector<Slot>>;

struct Feedback {
    std::vector<Slot> conflictSlots;
    // Stations that proposed each contested slot, in station id order.
    std::map<Slot, std::vector<StationId>> conflictDetails;
    std::vector<Slot> idleSlots;
    std::size_t usedSlots{0};
    double utilizationRate{0.0};
};

struct SuccessRecord {
    Demand demand;
    Allocation allocation;
    int roundsToSuccess{0};
    std::string timestamp;
};

nlohmann::json toJson(const Feedback& feedback);

nlohmann::json toJson(const SuccessRecord& record);
SuccessRecord successRecordFromJson(const nlohmann::json& node);

std::string formatSlots(const std::vector<Slot>& slots);

}  // namespace tdma::common
