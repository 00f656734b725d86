#pragma once

#include "tdma/allocator/ResourcePool.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace tdma::allocator {

enum class ReplacementPolicy {
    Coolest,
    Random,
};

ReplacementPolicy parseReplacementPolicy(const std::string& name);
std::string toString(ReplacementPolicy policy);

// Chooses the slot that replaces a collided one. candidates is never empty
// and is sorted ascending.
class ReplacementStrategy {
public:
    virtual ~ReplacementStrategy() = default;

    virtual Slot pickReplacement(const std::vector<Slot>& candidates, const ResourcePool& pool) = 0;
};

// Lowest heat wins, lowest index breaks ties.
class CoolestReplacement : public ReplacementStrategy {
public:
    Slot pickReplacement(const std::vector<Slot>& candidates, const ResourcePool& pool) override;
};

class RandomReplacement : public ReplacementStrategy {
public:
    explicit RandomReplacement(std::optional<std::uint64_t> seed = std::nullopt);

    Slot pickReplacement(const std::vector<Slot>& candidates, const ResourcePool& pool) override;

private:
    std::mt19937_64 rng_;
};

std::unique_ptr<ReplacementStrategy> makeReplacementStrategy(ReplacementPolicy policy,
                                                             std::optional<std::uint64_t> seed = std::nullopt);

}  // namespace tdma::allocator
