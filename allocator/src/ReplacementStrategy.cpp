#include "tdma/allocator/ReplacementStrategy.h"

#include "tdma/allocator/ConfigurationError.h"

#include <algorithm>
#include <stdexcept>

namespace tdma::allocator {

ReplacementPolicy parseReplacementPolicy(const std::string& name) {
    if (name == "coolest") {
        return ReplacementPolicy::Coolest;
    }
    if (name == "random") {
        return ReplacementPolicy::Random;
    }
    throw ConfigurationError("Unknown replacement policy '" + name + "' (expected coolest or random)");
}

std::string toString(ReplacementPolicy policy) {
    switch (policy) {
        case ReplacementPolicy::Coolest:
            return "coolest";
        case ReplacementPolicy::Random:
            return "random";
    }
    return "unknown";
}

Slot CoolestReplacement::pickReplacement(const std::vector<Slot>& candidates, const ResourcePool& pool) {
    if (candidates.empty()) {
        throw std::invalid_argument("pickReplacement requires at least one candidate");
    }
    return *std::min_element(candidates.begin(), candidates.end(), [&pool](Slot a, Slot b) {
        const int heatA = pool.heat(a);
        const int heatB = pool.heat(b);
        return heatA != heatB ? heatA < heatB : a < b;
    });
}

RandomReplacement::RandomReplacement(std::optional<std::uint64_t> seed)
    : rng_(seed.value_or(std::random_device{}())) {}

Slot RandomReplacement::pickReplacement(const std::vector<Slot>& candidates, const ResourcePool&) {
    if (candidates.empty()) {
        throw std::invalid_argument("pickReplacement requires at least one candidate");
    }
    std::uniform_int_distribution<std::size_t> dist(0, candidates.size() - 1);
    return candidates[dist(rng_)];
}

std::unique_ptr<ReplacementStrategy> makeReplacementStrategy(ReplacementPolicy policy,
                                                             std::optional<std::uint64_t> seed) {
    switch (policy) {
        case ReplacementPolicy::Coolest:
            return std::make_unique<CoolestReplacement>();
        case ReplacementPolicy::Random:
            return std::make_unique<RandomReplacement>(seed);
    }
    throw std::invalid_argument("Unhandled replacement policy");
}

}  // namespace tdma::allocator
