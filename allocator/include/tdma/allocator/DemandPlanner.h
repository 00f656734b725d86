#pragma once

#include "tdma/common/SlotTypes.h"

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace tdma::allocator {

using common::Demand;
using common::StationId;

struct DemandPlannerConfig {
    int minBase{1};
    int maxBase{4};
    std::optional<std::uint64_t> seed;
};

/**
 * @brief Draws per-station slot entitlements that exactly fill the pool.
 *
 * Every station gets a random base weight in [minBase, maxBase]. Undersubscribed
 * draws distribute the remainder in proportion to the weights; oversubscribed
 * draws are scaled down with a floor of one slot. Rounding drift is corrected
 * one unit at a time on randomly chosen stations, so the result always sums to
 * numSlots with every entry >= 1.
 */
class DemandPlanner {
public:
    explicit DemandPlanner(DemandPlannerConfig config = {});

    // Throws ConfigurationError when numStations < 1 or numStations > numSlots.
    std::vector<int> generateShares(int numStations, int numSlots);

    Demand generateDemand(const std::vector<StationId>& stations, int numSlots);

private:
    std::vector<int> distributeRemainder(const std::vector<int>& base, int numSlots);
    std::vector<int> scaleDown(const std::vector<int>& base, int numSlots);
    std::size_t pickStation(std::size_t count);

    DemandPlannerConfig config_;
    std::mt19937_64 rng_;
};

}  // namespace tdma::allocator
