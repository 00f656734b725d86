#include "tdma/allocator/ConfigurationError.h"
#include "tdma/allocator/RunConfig.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using tdma::allocator::ConfigurationError;
using tdma::allocator::DemandRefreshPolicy;
using tdma::allocator::ReplacementPolicy;
using tdma::allocator::RunConfig;
using tdma::allocator::RunOverrides;
using tdma::allocator::StationOrder;

namespace {

std::filesystem::path makeDir() {
    static std::size_t counter = 0;
    const auto suffix = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count() + counter++);
    const auto dir = std::filesystem::temp_directory_path() / ("tdma-config-" + suffix);
    std::filesystem::create_directories(dir);
    return dir;
}

std::filesystem::path writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream output(path);
    REQUIRE(output.good());
    output << content;
    return path;
}

const char* kFullRunFile = R"(
num_slots: 8
max_rounds: 25
demand_refresh: every_k_rounds
demand_refresh_interval: 3
station_order: round_robin
replacement_policy: random
random_seed: 42
query_timeout_ms: 750
convergence_rounds: 4
record_path: out/records.json
log_level: debug
stations:
  - id: AP1
    source: { type: heuristic, noise: 0.2, malformed_rate: 0.1 }
  - id: AP2
    source: { type: udp, host: 127.0.0.1, port: 9500 }
  - id: AP3
    source: { type: scripted, path: replies.json }
)";

}  // namespace

TEST_CASE("loadRunConfig reads every field", "[config]") {
    const auto dir = makeDir();
    const auto path = writeFile(dir / "run.yaml", kFullRunFile);

    const auto config = tdma::allocator::loadRunConfig(path);
    CHECK(config.numSlots == 8);
    CHECK(config.maxRounds == 25);
    CHECK(config.demandRefresh == DemandRefreshPolicy::EveryKRounds);
    CHECK(config.demandRefreshInterval == 3);
    CHECK(config.stationOrder == StationOrder::RoundRobin);
    CHECK(config.replacementPolicy == ReplacementPolicy::Random);
    REQUIRE(config.randomSeed.has_value());
    CHECK(*config.randomSeed == 42);
    CHECK(config.queryTimeoutMs == 750);
    CHECK(config.convergenceRounds == 4);
    CHECK(config.recordPath == std::filesystem::path("out/records.json"));
    CHECK(config.logLevel == "debug");

    REQUIRE(config.stations.size() == 3);
    CHECK(config.stations[0].id == "AP1");
    CHECK(config.stations[0].source.type == "heuristic");
    CHECK(config.stations[0].source.noise == 0.2);
    CHECK(config.stations[0].source.malformedRate == 0.1);
    CHECK(config.stations[1].source.host == "127.0.0.1");
    CHECK(config.stations[1].source.port == 9500);
    CHECK(config.stations[2].source.path == dir / "replies.json");

    REQUIRE_NOTHROW(tdma::allocator::validateRunConfig(config));

    const auto coordinator = config.coordinatorConfig();
    CHECK(coordinator.maxRounds == 25);
    CHECK(coordinator.queryTimeout == std::chrono::milliseconds(750));
    CHECK(coordinator.persistRecords);

    std::filesystem::remove_all(dir);
}

TEST_CASE("loadRunConfig applies defaults", "[config]") {
    const auto dir = makeDir();
    const auto path = writeFile(dir / "run.yaml", R"(
num_slots: 4
stations:
  - id: A
  - id: B
)");

    const auto config = tdma::allocator::loadRunConfig(path);
    CHECK(config.maxRounds == 100);
    CHECK(config.demandRefresh == DemandRefreshPolicy::OnSuccess);
    CHECK(config.stationOrder == StationOrder::Fixed);
    CHECK(config.replacementPolicy == ReplacementPolicy::Coolest);
    CHECK_FALSE(config.randomSeed.has_value());
    CHECK(config.stations[1].source.type == "heuristic");
    CHECK_FALSE(config.seedFor(3).has_value());

    std::filesystem::remove_all(dir);
}

TEST_CASE("loadRunConfig reports bad files", "[config]") {
    const auto dir = makeDir();

    SECTION("missing file") {
        REQUIRE_THROWS_AS(tdma::allocator::loadRunConfig(dir / "absent.yaml"), ConfigurationError);
    }

    SECTION("missing num_slots") {
        const auto path = writeFile(dir / "run.yaml", "stations:\n  - id: A\n");
        REQUIRE_THROWS_AS(tdma::allocator::loadRunConfig(path), ConfigurationError);
    }

    SECTION("ill-typed field") {
        const auto path = writeFile(dir / "run.yaml", "num_slots: many\nstations:\n  - id: A\n");
        REQUIRE_THROWS_AS(tdma::allocator::loadRunConfig(path), ConfigurationError);
    }

    SECTION("unknown policy") {
        const auto path = writeFile(dir / "run.yaml", "num_slots: 4\nstation_order: lottery\nstations:\n  - id: A\n");
        REQUIRE_THROWS_AS(tdma::allocator::loadRunConfig(path), ConfigurationError);
    }

    SECTION("unknown source type") {
        const auto path =
            writeFile(dir / "run.yaml", "num_slots: 4\nstations:\n  - id: A\n    source: { type: carrier_pigeon }\n");
        REQUIRE_THROWS_AS(tdma::allocator::loadRunConfig(path), ConfigurationError);
    }

    SECTION("udp port out of range") {
        const auto path =
            writeFile(dir / "run.yaml", "num_slots: 4\nstations:\n  - id: A\n    source: { type: udp, port: 70000 }\n");
        REQUIRE_THROWS_AS(tdma::allocator::loadRunConfig(path), ConfigurationError);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("validateRunConfig enforces run constraints", "[config]") {
    RunConfig config;
    config.numSlots = 2;
    config.stations = {{"A", {}}, {"B", {}}};
    REQUIRE_NOTHROW(tdma::allocator::validateRunConfig(config));

    SECTION("more stations than slots") {
        config.stations.push_back({"C", {}});
        REQUIRE_THROWS_AS(tdma::allocator::validateRunConfig(config), ConfigurationError);
    }

    SECTION("duplicate station") {
        config.stations[1].id = "A";
        REQUIRE_THROWS_AS(tdma::allocator::validateRunConfig(config), ConfigurationError);
    }

    SECTION("no stations") {
        config.stations.clear();
        REQUIRE_THROWS_AS(tdma::allocator::validateRunConfig(config), ConfigurationError);
    }

    SECTION("non-positive rounds") {
        config.maxRounds = 0;
        REQUIRE_THROWS_AS(tdma::allocator::validateRunConfig(config), ConfigurationError);
    }

    SECTION("noise outside [0, 1]") {
        config.stations[0].source.noise = 2.0;
        REQUIRE_THROWS_AS(tdma::allocator::validateRunConfig(config), ConfigurationError);
    }
}

TEST_CASE("Command-line overrides win over the run file", "[config]") {
    RunConfig config;
    config.numSlots = 4;
    config.stations = {{"A", {}}};

    RunOverrides overrides;
    overrides.numSlots = 12;
    overrides.maxRounds = 7;
    overrides.randomSeed = 5;
    overrides.stationOrder = "round_robin";
    overrides.replacementPolicy = "random";
    overrides.dryRun = true;
    tdma::allocator::applyOverrides(config, overrides);

    CHECK(config.numSlots == 12);
    CHECK(config.maxRounds == 7);
    CHECK(config.seedFor(2) == std::optional<std::uint64_t>(7));
    CHECK(config.stationOrder == StationOrder::RoundRobin);
    CHECK(config.replacementPolicy == ReplacementPolicy::Random);
    CHECK_FALSE(config.coordinatorConfig().persistRecords);

    overrides = RunOverrides{};
    overrides.stationOrder = "sideways";
    REQUIRE_THROWS_AS(tdma::allocator::applyOverrides(config, overrides), ConfigurationError);
}

TEST_CASE("buildStations creates one source per station", "[config]") {
    const auto dir = makeDir();
    writeFile(dir / "replies.json", R"({"S": ["{\"channels\": [0]}"]})");

    RunConfig config;
    config.numSlots = 4;
    config.randomSeed = 1;
    config.stations.push_back({"H", {}});
    tdma::allocator::StationSpec scriptedStation;
    scriptedStation.id = "S";
    scriptedStation.source.type = "scripted";
    scriptedStation.source.path = dir / "replies.json";
    config.stations.push_back(scriptedStation);

    SECTION("known sources") {
        const auto bindings = tdma::allocator::buildStations(config);
        REQUIRE(bindings.size() == 2);
        CHECK(bindings[0].id == "H");
        CHECK(bindings[0].source->describe().rfind("heuristic", 0) == 0);
        CHECK(bindings[1].source->describe() == "scripted(1 replies)");
    }

    SECTION("station missing from the reply file") {
        config.stations[1].id = "T";
        REQUIRE_THROWS_AS(tdma::allocator::buildStations(config), ConfigurationError);
    }

    std::filesystem::remove_all(dir);
}
