#include "tdma/allocator/ResourcePool.h"

#include "tdma/allocator/ConfigurationError.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tdma::allocator {

namespace {

int lookup(const std::map<Slot, int>& counters, Slot slot) {
    auto it = counters.find(slot);
    return it == counters.end() ? 0 : it->second;
}

}  // namespace

ResourcePool::ResourcePool(int numSlots) : numSlots_(numSlots) {
    if (numSlots_ < 1) {
        throw ConfigurationError("Resource pool needs at least one slot, got " + std::to_string(numSlots_));
    }
}

int ResourcePool::heat(Slot slot) const {
    return lookup(heat_, slot);
}

int ResourcePool::conflictCount(Slot slot) const {
    return lookup(conflictHistory_, slot);
}

std::vector<Slot> ResourcePool::coolestSlots(std::size_t count, const std::set<Slot>& excluding) const {
    std::vector<Slot> candidates;
    candidates.reserve(static_cast<std::size_t>(numSlots_));
    for (Slot slot = 0; slot < numSlots_; ++slot) {
        if (excluding.count(slot) == 0) {
            candidates.push_back(slot);
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(), [this](Slot a, Slot b) {
        return heat(a) < heat(b);
    });
    if (candidates.size() > count) {
        candidates.resize(count);
    }
    return candidates;
}

void ResourcePool::recordUsage(const Allocation& allocation) {
    for (const auto& [station, slots] : allocation) {
        for (Slot slot : slots) {
            requireInRange(slot);
            ++heat_[slot];
        }
    }
}

void ResourcePool::recordConflicts(const Allocation& rawProposals) {
    for (Slot slot : contestedSlots(rawProposals)) {
        if (contains(slot)) {
            ++conflictHistory_[slot];
        }
    }
}

Feedback ResourcePool::feedback(const Allocation& rawProposals, const Allocation& finalAllocation) const {
    Feedback result;
    result.conflictSlots = contestedSlots(rawProposals);
    for (Slot slot : result.conflictSlots) {
        auto& stations = result.conflictDetails[slot];
        for (const auto& [station, slots] : rawProposals) {
            if (std::find(slots.begin(), slots.end(), slot) != slots.end()) {
                stations.push_back(station);
            }
        }
    }

    std::set<Slot> proposed;
    std::size_t requested = 0;
    for (const auto& [station, slots] : rawProposals) {
        proposed.insert(slots.begin(), slots.end());
        requested += slots.size();
    }
    for (Slot slot = 0; slot < numSlots_; ++slot) {
        if (proposed.count(slot) == 0) {
            result.idleSlots.push_back(slot);
        }
    }

    std::set<Slot> used;
    for (const auto& [station, slots] : finalAllocation) {
        for (Slot slot : slots) {
            if (contains(slot)) {
                used.insert(slot);
            }
        }
    }
    result.usedSlots = used.size();

    // Oversubscribed rounds are measured against what was asked for, so a
    // round with a shortfall never reports full utilization.
    const auto capacity = std::max(static_cast<std::size_t>(numSlots_), requested);
    result.utilizationRate = static_cast<double>(used.size()) / static_cast<double>(capacity);
    return result;
}

std::vector<Slot> ResourcePool::contestedSlots(const Allocation& proposals) {
    std::map<Slot, int> users;
    for (const auto& [station, slots] : proposals) {
        const std::set<Slot> unique(slots.begin(), slots.end());
        for (Slot slot : unique) {
            ++users[slot];
        }
    }
    std::vector<Slot> contested;
    for (const auto& [slot, count] : users) {
        if (count > 1) {
            contested.push_back(slot);
        }
    }
    return contested;
}

std::vector<std::pair<Slot, int>> ResourcePool::heatRanking() const {
    std::vector<std::pair<Slot, int>> ranking;
    ranking.reserve(static_cast<std::size_t>(numSlots_));
    for (Slot slot : coolestSlots(static_cast<std::size_t>(numSlots_))) {
        ranking.emplace_back(slot, heat(slot));
    }
    return ranking;
}

void ResourcePool::requireInRange(Slot slot) const {
    if (!contains(slot)) {
        throw std::out_of_range("Slot " + std::to_string(slot) + " outside [0, " + std::to_string(numSlots_) + ")");
    }
}

}  // namespace tdma::allocator
