#pragma once

#include "tdma/allocator/ResourcePool.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace tdma::allocator {

using common::ValidatedSet;

// Raw slot entries as extracted from a reply; std::nullopt when the reply had
// no usable structure at all.
using RawProposal = std::optional<std::vector<nlohmann::json>>;

struct ValidationOutcome {
    ValidatedSet slots;
    std::size_t accepted{0};      // raw entries that survived coercion, range check and dedup
    std::size_t discarded{0};
    std::size_t backfilled{0};
    bool usedFallback{false};     // the whole set came from the fallback path
    bool degenerate{false};       // duplicates were reintroduced because the domain ran out
};

class ProposalValidator {
public:
    explicit ProposalValidator(std::optional<std::uint64_t> seed = std::nullopt);

    /**
     * @brief Repairs @p raw into exactly @p expected sorted slots.
     *
     * Invalid entries are dropped and duplicates collapsed (first occurrence
     * wins). Shortfalls are filled with the coolest unused slots, then random
     * unused slots, and only when the domain is exhausted with random repeats.
     * Surplus entries are cut after sorting ascending. Never throws.
     */
    ValidationOutcome validate(const RawProposal& raw, int expected, const ResourcePool& pool);

    static std::optional<Slot> coerceSlot(const nlohmann::json& entry);

private:
    std::mt19937_64 rng_;
};

}  // namespace tdma::allocator
