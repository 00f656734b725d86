#include "tdma/allocator/ProposalValidator.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>
#include <string>

namespace tdma::allocator {

namespace {

using json = nlohmann::json;

std::string trimCopy(const std::string& value) {
    auto first = value.begin();
    while (first != value.end() && std::isspace(static_cast<unsigned char>(*first))) {
        ++first;
    }
    auto last = value.end();
    while (last != first && std::isspace(static_cast<unsigned char>(*(last - 1)))) {
        --last;
    }
    return std::string(first, last);
}

std::optional<Slot> truncateToSlot(double value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    const double truncated = std::trunc(value);
    if (truncated < static_cast<double>(std::numeric_limits<Slot>::min()) ||
        truncated > static_cast<double>(std::numeric_limits<Slot>::max())) {
        return std::nullopt;
    }
    return static_cast<Slot>(truncated);
}

}  // namespace

ProposalValidator::ProposalValidator(std::optional<std::uint64_t> seed)
    : rng_(seed.value_or(std::random_device{}())) {}

std::optional<Slot> ProposalValidator::coerceSlot(const json& entry) {
    if (entry.is_number_integer()) {
        if (entry.is_number_unsigned()) {
            const auto raw = entry.get<std::uint64_t>();
            if (raw > static_cast<std::uint64_t>(std::numeric_limits<Slot>::max())) {
                return std::nullopt;
            }
            return static_cast<Slot>(raw);
        }
        const auto raw = entry.get<std::int64_t>();
        if (raw < std::numeric_limits<Slot>::min() || raw > std::numeric_limits<Slot>::max()) {
            return std::nullopt;
        }
        return static_cast<Slot>(raw);
    }
    if (entry.is_number_float()) {
        return truncateToSlot(entry.get<double>());
    }
    if (entry.is_string()) {
        const auto text = trimCopy(entry.get<std::string>());
        if (text.empty()) {
            return std::nullopt;
        }
        try {
            std::size_t consumed = 0;
            const double value = std::stod(text, &consumed);
            if (consumed != text.size()) {
                return std::nullopt;
            }
            return truncateToSlot(value);
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

ValidationOutcome ProposalValidator::validate(const RawProposal& raw, int expected, const ResourcePool& pool) {
    ValidationOutcome outcome;
    if (expected <= 0) {
        return outcome;
    }
    const auto want = static_cast<std::size_t>(expected);

    std::vector<Slot> surviving;
    std::set<Slot> seen;
    if (raw.has_value()) {
        for (const auto& entry : *raw) {
            const auto slot = coerceSlot(entry);
            if (!slot || !pool.contains(*slot) || !seen.insert(*slot).second) {
                ++outcome.discarded;
                continue;
            }
            surviving.push_back(*slot);
        }
    } else {
        outcome.usedFallback = true;
    }
    outcome.accepted = surviving.size();

    if (surviving.size() > want) {
        std::sort(surviving.begin(), surviving.end());
        surviving.resize(want);
    }

    if (surviving.size() < want) {
        const auto before = surviving.size();
        for (Slot slot : pool.coolestSlots(want - surviving.size(), seen)) {
            surviving.push_back(slot);
            seen.insert(slot);
        }

        if (surviving.size() < want) {
            std::vector<Slot> unused;
            for (Slot slot = 0; slot < pool.numSlots(); ++slot) {
                if (seen.count(slot) == 0) {
                    unused.push_back(slot);
                }
            }
            std::shuffle(unused.begin(), unused.end(), rng_);
            for (Slot slot : unused) {
                if (surviving.size() >= want) {
                    break;
                }
                surviving.push_back(slot);
                seen.insert(slot);
            }
        }

        if (surviving.size() < want) {
            outcome.degenerate = true;
            std::uniform_int_distribution<Slot> any(0, pool.numSlots() - 1);
            while (surviving.size() < want) {
                surviving.push_back(any(rng_));
            }
        }
        outcome.backfilled = surviving.size() - before;
    }

    std::sort(surviving.begin(), surviving.end());
    outcome.slots = std::move(surviving);
    return outcome;
}

}  // namespace tdma::allocator
