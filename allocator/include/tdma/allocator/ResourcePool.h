#pragma once

#include "tdma/common/SlotTypes.h"

#include <map>
#include <set>
#include <utility>
#include <vector>

namespace tdma::allocator {

using common::Allocation;
using common::Feedback;
using common::Slot;
using common::StationId;

/**
 * @brief Owns the slot domain [0, numSlots) and its usage counters.
 *
 * heat counts how often a slot ended up in a final allocation; conflict
 * history counts rounds in which a slot was proposed by more than one
 * station before resolution. Both only ever grow.
 */
class ResourcePool {
public:
    explicit ResourcePool(int numSlots);

    int numSlots() const noexcept { return numSlots_; }
    bool contains(Slot slot) const noexcept { return slot >= 0 && slot < numSlots_; }

    int heat(Slot slot) const;
    int conflictCount(Slot slot) const;

    /**
     * @brief Up to @p count slots outside @p excluding, coolest first.
     *
     * Ties are broken by ascending slot index. Fewer than @p count slots are
     * returned when the domain runs out.
     */
    std::vector<Slot> coolestSlots(std::size_t count, const std::set<Slot>& excluding = {}) const;

    // One increment per (station, slot) pair in the final allocation.
    void recordUsage(const Allocation& allocation);

    // One increment per slot proposed by two or more stations.
    void recordConflicts(const Allocation& rawProposals);

    Feedback feedback(const Allocation& rawProposals, const Allocation& finalAllocation) const;

    // Slots that appear in more than one station's proposal, ascending.
    static std::vector<Slot> contestedSlots(const Allocation& proposals);

    std::vector<std::pair<Slot, int>> heatRanking() const;
    const std::map<Slot, int>& conflictHistory() const noexcept { return conflictHistory_; }

private:
    void requireInRange(Slot slot) const;

    int numSlots_;
    std::map<Slot, int> heat_;
    std::map<Slot, int> conflictHistory_;
};

}  // namespace tdma::allocator
