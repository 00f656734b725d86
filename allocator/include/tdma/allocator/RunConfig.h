#pragma once

#include "tdma/allocator/ReplacementStrategy.h"
#include "tdma/allocator/RoundCoordinator.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tdma::allocator {

struct SourceSpec {
    std::string type{"heuristic"};   // heuristic | udp | scripted
    double noise{0.0};
    double malformedRate{0.0};
    std::string host{"127.0.0.1"};
    std::uint16_t port{0};
    std::filesystem::path path;
};

struct StationSpec {
    StationId id;
    SourceSpec source;
};

struct RunConfig {
    int numSlots{0};
    int maxRounds{100};
    DemandRefreshPolicy demandRefresh{DemandRefreshPolicy::OnSuccess};
    int demandRefreshInterval{1};
    StationOrder stationOrder{StationOrder::Fixed};
    ReplacementPolicy replacementPolicy{ReplacementPolicy::Coolest};
    std::optional<std::uint64_t> randomSeed;
    int queryTimeoutMs{5000};
    int convergenceRounds{0};
    std::filesystem::path recordPath{"success_records.json"};
    std::string logLevel{"info"};
    bool dryRun{false};
    std::vector<StationSpec> stations;

    CoordinatorConfig coordinatorConfig() const;

    // Seed for one consumer of randomness; empty when the run is unseeded.
    std::optional<std::uint64_t> seedFor(std::uint64_t salt) const;
};

// Command-line values that take precedence over the run file.
struct RunOverrides {
    std::optional<int> numSlots;
    std::optional<int> maxRounds;
    std::optional<std::filesystem::path> recordPath;
    std::optional<std::string> logLevel;
    std::optional<std::uint64_t> randomSeed;
    std::optional<std::string> stationOrder;
    std::optional<std::string> replacementPolicy;
    bool dryRun{false};
};

/**
 * @brief Reads a YAML run file.
 *
 * Relative scripted-reply paths are resolved against the run file's
 * directory. Missing or ill-typed fields raise ConfigurationError.
 */
RunConfig loadRunConfig(const std::filesystem::path& path);

void applyOverrides(RunConfig& config, const RunOverrides& overrides);

// Throws ConfigurationError on the first violated constraint.
void validateRunConfig(const RunConfig& config);

// One decision source per configured station, in configuration order.
std::vector<StationBinding> buildStations(const RunConfig& config);

}  // namespace tdma::allocator
