#include "tdma/allocator/RunConfig.h"

#include "tdma/agent/HeuristicDecisionSource.h"
#include "tdma/agent/ScriptedDecisionSource.h"
#include "tdma/agent/UdpDecisionSource.h"
#include "tdma/allocator/ConfigurationError.h"

#include <yaml-cpp/yaml.h>

#include <limits>
#include <map>
#include <set>

namespace tdma::allocator {

namespace {

template <typename T>
T scalar_or_throw(const YAML::Node& node, const std::string& field) {
    if (!node || !node.IsScalar()) {
        throw ConfigurationError("Field '" + field + "' must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& ex) {
        throw ConfigurationError("Field '" + field + "' has the wrong type: " + ex.what());
    }
}

template <typename T>
void optionalScalar(const YAML::Node& root, const char* field, T& target) {
    if (auto node = root[field]; node && !node.IsNull()) {
        target = scalar_or_throw<T>(node, field);
    }
}

SourceSpec parseSource(const YAML::Node& node, const std::string& stationField,
                       const std::filesystem::path& baseDir) {
    SourceSpec source;
    if (!node || node.IsNull()) {
        return source;
    }
    if (!node.IsMap()) {
        throw ConfigurationError("Field '" + stationField + ".source' must be a map");
    }

    source.type = scalar_or_throw<std::string>(node["type"], stationField + ".source.type");
    if (source.type == "heuristic") {
        if (node["noise"]) {
            source.noise = scalar_or_throw<double>(node["noise"], stationField + ".source.noise");
        }
        if (node["malformed_rate"]) {
            source.malformedRate =
                scalar_or_throw<double>(node["malformed_rate"], stationField + ".source.malformed_rate");
        }
    } else if (source.type == "udp") {
        if (node["host"]) {
            source.host = scalar_or_throw<std::string>(node["host"], stationField + ".source.host");
        }
        const auto port = scalar_or_throw<int>(node["port"], stationField + ".source.port");
        if (port < 1 || port > std::numeric_limits<std::uint16_t>::max()) {
            throw ConfigurationError("Field '" + stationField + ".source.port' must be within [1, 65535]");
        }
        source.port = static_cast<std::uint16_t>(port);
    } else if (source.type == "scripted") {
        std::filesystem::path path = scalar_or_throw<std::string>(node["path"], stationField + ".source.path");
        if (path.is_relative()) {
            path = baseDir / path;
        }
        source.path = path;
    } else {
        throw ConfigurationError("Field '" + stationField + ".source.type' must be heuristic, udp or scripted (got '" +
                                 source.type + "')");
    }
    return source;
}

}  // namespace

CoordinatorConfig RunConfig::coordinatorConfig() const {
    CoordinatorConfig config;
    config.maxRounds = maxRounds;
    config.demandRefresh = demandRefresh;
    config.demandRefreshInterval = demandRefreshInterval;
    config.stationOrder = stationOrder;
    config.queryTimeout = std::chrono::milliseconds(queryTimeoutMs);
    config.convergenceRounds = convergenceRounds;
    config.persistRecords = !dryRun;
    return config;
}

std::optional<std::uint64_t> RunConfig::seedFor(std::uint64_t salt) const {
    if (!randomSeed) {
        return std::nullopt;
    }
    return *randomSeed + salt;
}

RunConfig loadRunConfig(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& ex) {
        throw ConfigurationError("Failed to load run file " + path.string() + ": " + ex.what());
    }
    if (!root.IsMap()) {
        throw ConfigurationError("Run file " + path.string() + " must contain a map at the root");
    }

    RunConfig config;
    config.numSlots = scalar_or_throw<int>(root["num_slots"], "num_slots");
    optionalScalar(root, "max_rounds", config.maxRounds);
    optionalScalar(root, "demand_refresh_interval", config.demandRefreshInterval);
    optionalScalar(root, "query_timeout_ms", config.queryTimeoutMs);
    optionalScalar(root, "convergence_rounds", config.convergenceRounds);
    optionalScalar(root, "log_level", config.logLevel);

    if (root["demand_refresh"]) {
        config.demandRefresh =
            parseDemandRefreshPolicy(scalar_or_throw<std::string>(root["demand_refresh"], "demand_refresh"));
    }
    if (root["station_order"]) {
        config.stationOrder = parseStationOrder(scalar_or_throw<std::string>(root["station_order"], "station_order"));
    }
    if (root["replacement_policy"]) {
        config.replacementPolicy =
            parseReplacementPolicy(scalar_or_throw<std::string>(root["replacement_policy"], "replacement_policy"));
    }
    if (auto seed = root["random_seed"]; seed && !seed.IsNull()) {
        config.randomSeed = scalar_or_throw<std::uint64_t>(seed, "random_seed");
    }
    if (auto records = root["record_path"]; records && !records.IsNull()) {
        config.recordPath = scalar_or_throw<std::string>(records, "record_path");
    }

    auto stationsNode = root["stations"];
    if (!stationsNode || !stationsNode.IsSequence()) {
        throw ConfigurationError("Run file must contain a 'stations' sequence");
    }
    const auto baseDir = path.parent_path();
    for (const auto& stationNode : stationsNode) {
        StationSpec station;
        station.id = scalar_or_throw<std::string>(stationNode["id"], "stations[].id");
        station.source = parseSource(stationNode["source"], "stations[" + station.id + "]", baseDir);
        config.stations.push_back(std::move(station));
    }
    return config;
}

void applyOverrides(RunConfig& config, const RunOverrides& overrides) {
    if (overrides.numSlots) {
        config.numSlots = *overrides.numSlots;
    }
    if (overrides.maxRounds) {
        config.maxRounds = *overrides.maxRounds;
    }
    if (overrides.recordPath) {
        config.recordPath = *overrides.recordPath;
    }
    if (overrides.logLevel) {
        config.logLevel = *overrides.logLevel;
    }
    if (overrides.randomSeed) {
        config.randomSeed = overrides.randomSeed;
    }
    if (overrides.stationOrder) {
        config.stationOrder = parseStationOrder(*overrides.stationOrder);
    }
    if (overrides.replacementPolicy) {
        config.replacementPolicy = parseReplacementPolicy(*overrides.replacementPolicy);
    }
    if (overrides.dryRun) {
        config.dryRun = true;
    }
}

void validateRunConfig(const RunConfig& config) {
    if (config.numSlots < 1) {
        throw ConfigurationError("num_slots must be at least 1");
    }
    if (config.maxRounds < 1) {
        throw ConfigurationError("max_rounds must be at least 1");
    }
    if (config.demandRefreshInterval < 1) {
        throw ConfigurationError("demand_refresh_interval must be at least 1");
    }
    if (config.queryTimeoutMs < 1) {
        throw ConfigurationError("query_timeout_ms must be at least 1");
    }
    if (config.convergenceRounds < 0) {
        throw ConfigurationError("convergence_rounds must not be negative");
    }
    if (config.stations.empty()) {
        throw ConfigurationError("At least one station is required");
    }
    if (static_cast<int>(config.stations.size()) > config.numSlots) {
        throw ConfigurationError(std::to_string(config.stations.size()) + " stations exceed num_slots " +
                                 std::to_string(config.numSlots));
    }

    std::set<StationId> ids;
    for (const auto& station : config.stations) {
        if (station.id.empty()) {
            throw ConfigurationError("Station id must not be empty");
        }
        if (!ids.insert(station.id).second) {
            throw ConfigurationError("Duplicate station id '" + station.id + "'");
        }
        const auto& source = station.source;
        if (source.type == "heuristic") {
            if (source.noise < 0.0 || source.noise > 1.0) {
                throw ConfigurationError("Station '" + station.id + "' noise must be within [0, 1]");
            }
            if (source.malformedRate < 0.0 || source.malformedRate > 1.0) {
                throw ConfigurationError("Station '" + station.id + "' malformed_rate must be within [0, 1]");
            }
        } else if (source.type == "udp") {
            if (source.host.empty() || source.port == 0) {
                throw ConfigurationError("Station '" + station.id + "' needs a UDP host and port");
            }
        } else if (source.type == "scripted") {
            if (source.path.empty()) {
                throw ConfigurationError("Station '" + station.id + "' needs a scripted reply path");
            }
        } else {
            throw ConfigurationError("Station '" + station.id + "' has unknown source type '" + source.type + "'");
        }
    }
}

std::vector<StationBinding> buildStations(const RunConfig& config) {
    std::vector<StationBinding> bindings;
    std::map<std::filesystem::path, std::map<StationId, std::vector<std::string>>> scripts;

    std::uint64_t salt = 100;
    for (const auto& station : config.stations) {
        const auto& spec = station.source;
        StationBinding binding;
        binding.id = station.id;
        try {
            if (spec.type == "heuristic") {
                agent::HeuristicConfig heuristic;
                heuristic.noise = spec.noise;
                heuristic.malformedRate = spec.malformedRate;
                heuristic.seed = config.seedFor(salt);
                binding.source = std::make_shared<agent::HeuristicDecisionSource>(heuristic);
            } else if (spec.type == "udp") {
                binding.source = std::make_shared<agent::UdpDecisionSource>(spec.host, spec.port);
            } else if (spec.type == "scripted") {
                auto it = scripts.find(spec.path);
                if (it == scripts.end()) {
                    it = scripts.emplace(spec.path, agent::loadScriptedReplies(spec.path)).first;
                }
                auto replies = it->second.find(station.id);
                if (replies == it->second.end()) {
                    throw ConfigurationError("No scripted replies for station '" + station.id + "' in " +
                                             spec.path.string());
                }
                binding.source = std::make_shared<agent::ScriptedDecisionSource>(replies->second);
            } else {
                throw ConfigurationError("Station '" + station.id + "' has unknown source type '" + spec.type + "'");
            }
        } catch (const ConfigurationError&) {
            throw;
        } catch (const std::exception& ex) {
            throw ConfigurationError("Station '" + station.id + "': " + ex.what());
        }
        ++salt;
        bindings.push_back(std::move(binding));
    }
    return bindings;
}

}  // namespace tdma::allocator
