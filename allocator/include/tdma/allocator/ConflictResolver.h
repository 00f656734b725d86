#pragma once

#include "tdma/allocator/ReplacementStrategy.h"
#include "tdma/allocator/ResourcePool.h"

#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace tdma::allocator {

using common::ValidatedSet;

struct Resolution {
    Allocation allocation;
    std::map<StationId, int> shortfall;    // requested minus kept, 0 when satisfied
    std::map<StationId, int> collisions;   // candidate slots that had to be replaced or dropped
};

/**
 * @brief Sequential greedy reservation over validated candidate sets.
 *
 * Stations are processed in the given order. A candidate slot that is
 * already reserved by an earlier station (or repeated within the station's
 * own set) is replaced by a slot picked from the domain minus the reserved
 * slots, the slots kept so far for this station and the station's own
 * candidates. When nothing is left the station is short. The result is
 * pairwise disjoint and every final set is sorted.
 */
class ConflictResolver {
public:
    explicit ConflictResolver(std::unique_ptr<ReplacementStrategy> strategy);

    Resolution resolve(const std::vector<std::pair<StationId, ValidatedSet>>& orderedCandidates,
                       const ResourcePool& pool);

private:
    std::unique_ptr<ReplacementStrategy> strategy_;
};

}  // namespace tdma::allocator
