#include "tdma/allocator/DemandPlanner.h"

#include "tdma/allocator/ConfigurationError.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

namespace tdma::allocator {

namespace {

int sum(const std::vector<int>& values) {
    return std::accumulate(values.begin(), values.end(), 0);
}

}  // namespace

DemandPlanner::DemandPlanner(DemandPlannerConfig config)
    : config_(config),
      rng_(config.seed.value_or(std::random_device{}())) {
    if (config_.minBase < 1 || config_.maxBase < config_.minBase) {
        throw ConfigurationError("Demand base range must satisfy 1 <= min <= max");
    }
}

std::vector<int> DemandPlanner::generateShares(int numStations, int numSlots) {
    if (numStations < 1) {
        throw ConfigurationError("At least one station is required");
    }
    if (numStations > numSlots) {
        throw ConfigurationError("Cannot give " + std::to_string(numStations) + " stations at least one of "
                                 + std::to_string(numSlots) + " slots");
    }

    std::uniform_int_distribution<int> draw(config_.minBase, config_.maxBase);
    std::vector<int> base(static_cast<std::size_t>(numStations));
    for (auto& value : base) {
        value = draw(rng_);
    }

    if (sum(base) <= numSlots) {
        return distributeRemainder(base, numSlots);
    }
    return scaleDown(base, numSlots);
}

Demand DemandPlanner::generateDemand(const std::vector<StationId>& stations, int numSlots) {
    const auto shares = generateShares(static_cast<int>(stations.size()), numSlots);
    Demand demand;
    for (std::size_t i = 0; i < stations.size(); ++i) {
        demand[stations[i]] = shares[i];
    }
    return demand;
}

std::vector<int> DemandPlanner::distributeRemainder(const std::vector<int>& base, int numSlots) {
    const int total = sum(base);
    const int remainder = numSlots - total;

    std::vector<int> additions(base.size());
    for (std::size_t i = 0; i < base.size(); ++i) {
        const double weight = static_cast<double>(base[i]) / static_cast<double>(total);
        additions[i] = static_cast<int>(std::lround(remainder * weight));
    }

    int drift = remainder - sum(additions);
    while (drift > 0) {
        ++additions[pickStation(additions.size())];
        --drift;
    }
    while (drift < 0) {
        const auto idx = pickStation(additions.size());
        if (additions[idx] > 0) {
            --additions[idx];
            ++drift;
        }
    }

    std::vector<int> shares(base.size());
    for (std::size_t i = 0; i < base.size(); ++i) {
        shares[i] = base[i] + additions[i];
    }
    return shares;
}

std::vector<int> DemandPlanner::scaleDown(const std::vector<int>& base, int numSlots) {
    const int total = sum(base);

    std::vector<int> shares(base.size());
    for (std::size_t i = 0; i < base.size(); ++i) {
        const auto scaled = static_cast<long long>(base[i]) * numSlots / total;
        shares[i] = std::max(1, static_cast<int>(scaled));
    }

    int drift = numSlots - sum(shares);
    while (drift > 0) {
        ++shares[pickStation(shares.size())];
        --drift;
    }
    // numStations <= numSlots guarantees some entry stays above the floor here.
    while (drift < 0) {
        const auto idx = pickStation(shares.size());
        if (shares[idx] > 1) {
            --shares[idx];
            ++drift;
        }
    }
    return shares;
}

std::size_t DemandPlanner::pickStation(std::size_t count) {
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(rng_);
}

}  // namespace tdma::allocator
