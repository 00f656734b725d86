#include "tdma/allocator/ConfigurationError.h"
#include "tdma/allocator/ConflictResolver.h"
#include "tdma/allocator/DemandPlanner.h"
#include "tdma/allocator/ProposalValidator.h"
#include "tdma/allocator/ResourcePool.h"
#include "tdma/allocator/RoundCoordinator.h"
#include "tdma/allocator/RunConfig.h"
#include "tdma/common/Logging.h"
#include "tdma/common/SuccessRecordStore.h"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

namespace {

std::atomic_bool g_shouldStop{false};

void handleSignal(int) {
    g_shouldStop.store(true);
}

struct CoordinatorOptions {
    std::filesystem::path configPath;
    std::optional<int> slots;
    std::optional<int> maxRounds;
    std::optional<std::filesystem::path> recordPath;
    std::optional<std::string> logLevel;
    std::optional<std::uint64_t> seed;
    std::optional<std::string> order;
    std::optional<std::string> policy;
    bool dryRun{false};
};

void printSummary(const tdma::allocator::RunSummary& summary, const tdma::common::SuccessRecordStore& store) {
    std::cout << "Run summary\n"
              << "  termination      : " << tdma::allocator::toString(summary.termination) << "\n"
              << "  rounds run       : " << summary.roundsRun << "\n"
              << "  success rounds   : " << summary.successRounds << "\n"
              << "  raw conflicts    : " << summary.totalRawConflicts << "\n"
              << "  mean utilization : " << std::fixed << std::setprecision(3) << summary.meanUtilization << "\n"
              << "  fallbacks        : " << summary.fallbackCount << "\n"
              << "  slot shortfall   : " << summary.shortfallTotal << "\n"
              << "  persist failures : " << summary.persistenceFailures << "\n"
              << "  stored records   : " << store.size() << " (" << store.path().string() << ")\n";
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"TDMA slot allocation coordinator"};
    CoordinatorOptions opts;

    app.add_option("config,--config", opts.configPath, "YAML run file")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("--slots", opts.slots, "Override num_slots");
    app.add_option("--max-rounds", opts.maxRounds, "Override max_rounds");
    app.add_option("--records", opts.recordPath, "Override record_path");
    app.add_option("--log-level", opts.logLevel, "trace, debug, info, warn, error, critical or off");
    app.add_option("--seed", opts.seed, "Override random_seed");
    app.add_option("--order", opts.order, "Station order")
        ->check(CLI::IsMember({"fixed", "round_robin"}));
    app.add_option("--policy", opts.policy, "Collision replacement policy")
        ->check(CLI::IsMember({"coolest", "random"}));
    app.add_flag("--dry-run", opts.dryRun, "Run rounds without persisting success records");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    try {
        auto config = tdma::allocator::loadRunConfig(opts.configPath);

        tdma::allocator::RunOverrides overrides;
        overrides.numSlots = opts.slots;
        overrides.maxRounds = opts.maxRounds;
        overrides.recordPath = opts.recordPath;
        overrides.logLevel = opts.logLevel;
        overrides.randomSeed = opts.seed;
        overrides.stationOrder = opts.order;
        overrides.replacementPolicy = opts.policy;
        overrides.dryRun = opts.dryRun;
        tdma::allocator::applyOverrides(config, overrides);

        tdma::common::configureLogging(config.logLevel);
        tdma::allocator::validateRunConfig(config);

        tdma::common::SuccessRecordStore store(config.recordPath);
        try {
            store.load();
            spdlog::info("Loaded {} historical success record(s) from {}", store.size(), store.path().string());
        } catch (const std::exception& ex) {
            spdlog::error("Failed to load success records: {}", ex.what());
            return 1;
        }

        tdma::allocator::ResourcePool pool(config.numSlots);
        tdma::allocator::DemandPlannerConfig plannerConfig;
        plannerConfig.seed = config.seedFor(0);
        tdma::allocator::DemandPlanner planner(plannerConfig);
        tdma::allocator::ProposalValidator validator(config.seedFor(1));
        tdma::allocator::ConflictResolver resolver(
            tdma::allocator::makeReplacementStrategy(config.replacementPolicy, config.seedFor(2)));

        auto stations = tdma::allocator::buildStations(config);
        for (const auto& binding : stations) {
            spdlog::info("Station {} uses {}", binding.id, binding.source->describe());
        }

        tdma::allocator::RoundCoordinator coordinator(config.coordinatorConfig(), std::move(stations), pool, planner,
                                                      validator, resolver, &store);
        coordinator.bindStopFlag(&g_shouldStop);

        spdlog::info("Starting run: {} slots, max {} rounds, refresh {}, order {}, policy {}{}",
                     config.numSlots, config.maxRounds, tdma::allocator::toString(config.demandRefresh),
                     tdma::allocator::toString(config.stationOrder),
                     tdma::allocator::toString(config.replacementPolicy), config.dryRun ? ", dry run" : "");

        const auto summary = coordinator.run();
        printSummary(summary, store);
    } catch (const tdma::allocator::ConfigurationError& ex) {
        spdlog::error("Configuration error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        spdlog::error("Coordinator failed: {}", ex.what());
        return 1;
    }

    return 0;
}
