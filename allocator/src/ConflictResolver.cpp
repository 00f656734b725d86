#include "tdma/allocator/ConflictResolver.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace tdma::allocator {

ConflictResolver::ConflictResolver(std::unique_ptr<ReplacementStrategy> strategy)
    : strategy_(std::move(strategy)) {
    if (!strategy_) {
        throw std::invalid_argument("ConflictResolver requires a replacement strategy");
    }
}

Resolution ConflictResolver::resolve(const std::vector<std::pair<StationId, ValidatedSet>>& orderedCandidates,
                                     const ResourcePool& pool) {
    Resolution resolution;
    std::set<Slot> reserved;

    for (const auto& [station, candidates] : orderedCandidates) {
        const std::set<Slot> own(candidates.begin(), candidates.end());
        std::set<Slot> kept;
        int collisions = 0;
        int missing = 0;

        for (Slot slot : candidates) {
            if (pool.contains(slot) && reserved.count(slot) == 0 && kept.count(slot) == 0) {
                kept.insert(slot);
                continue;
            }

            ++collisions;
            std::vector<Slot> free;
            for (Slot candidate = 0; candidate < pool.numSlots(); ++candidate) {
                if (reserved.count(candidate) == 0 && kept.count(candidate) == 0 && own.count(candidate) == 0) {
                    free.push_back(candidate);
                }
            }
            if (free.empty()) {
                ++missing;
                continue;
            }
            const Slot replacement = strategy_->pickReplacement(free, pool);
            spdlog::debug("Station {} slot {} collided, replaced with {}", station, slot, replacement);
            kept.insert(replacement);
        }

        if (missing > 0) {
            spdlog::debug("Station {} is short by {} slot(s)", station, missing);
        }

        reserved.insert(kept.begin(), kept.end());
        resolution.allocation[station] = std::vector<Slot>(kept.begin(), kept.end());
        resolution.shortfall[station] = missing;
        resolution.collisions[station] = collisions;
    }

    return resolution;
}

}  // namespace tdma::allocator
