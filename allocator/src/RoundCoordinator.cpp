#include "tdma/allocator/RoundCoordinator.h"

#include "tdma/agent/ResponseParser.h"
#include "tdma/allocator/ConfigurationError.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <sstream>
#include <stdexcept>

namespace tdma::allocator {

namespace {

std::string formatDemand(const Demand& demand) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [station, count] : demand) {
        if (!first) {
            oss << ' ';
        }
        first = false;
        oss << station << '=' << count;
    }
    return oss.str();
}

}  // namespace

std::string toString(RoundState state) {
    switch (state) {
        case RoundState::Idle:
            return "idle";
        case RoundState::DemandGenerated:
            return "demand_generated";
        case RoundState::Negotiating:
            return "negotiating";
        case RoundState::Resolved:
            return "resolved";
        case RoundState::Recorded:
            return "recorded";
        case RoundState::Terminated:
            return "terminated";
    }
    return "unknown";
}

std::string toString(DemandRefreshPolicy policy) {
    switch (policy) {
        case DemandRefreshPolicy::OnSuccess:
            return "on_success";
        case DemandRefreshPolicy::EveryRound:
            return "every_round";
        case DemandRefreshPolicy::EveryKRounds:
            return "every_k_rounds";
    }
    return "unknown";
}

std::string toString(StationOrder order) {
    switch (order) {
        case StationOrder::Fixed:
            return "fixed";
        case StationOrder::RoundRobin:
            return "round_robin";
    }
    return "unknown";
}

std::string toString(Termination termination) {
    switch (termination) {
        case Termination::MaxRounds:
            return "max_rounds";
        case Termination::Cancelled:
            return "cancelled";
        case Termination::Converged:
            return "converged";
    }
    return "unknown";
}

DemandRefreshPolicy parseDemandRefreshPolicy(const std::string& name) {
    if (name == "on_success") {
        return DemandRefreshPolicy::OnSuccess;
    }
    if (name == "every_round") {
        return DemandRefreshPolicy::EveryRound;
    }
    if (name == "every_k_rounds") {
        return DemandRefreshPolicy::EveryKRounds;
    }
    throw ConfigurationError("Unknown demand refresh policy '" + name +
                             "' (expected on_success, every_round or every_k_rounds)");
}

StationOrder parseStationOrder(const std::string& name) {
    if (name == "fixed") {
        return StationOrder::Fixed;
    }
    if (name == "round_robin") {
        return StationOrder::RoundRobin;
    }
    throw ConfigurationError("Unknown station order '" + name + "' (expected fixed or round_robin)");
}

RoundCoordinator::RoundCoordinator(CoordinatorConfig config,
                                   std::vector<StationBinding> stations,
                                   ResourcePool& pool,
                                   DemandPlanner& planner,
                                   ProposalValidator& validator,
                                   ConflictResolver& resolver,
                                   common::SuccessRecordStore* store)
    : config_(config),
      stations_(std::move(stations)),
      pool_(pool),
      planner_(planner),
      validator_(validator),
      resolver_(resolver),
      store_(store) {
    if (stations_.empty()) {
        throw ConfigurationError("At least one station is required");
    }
    std::set<StationId> seen;
    for (const auto& binding : stations_) {
        if (binding.id.empty()) {
            throw ConfigurationError("Station id must not be empty");
        }
        if (!seen.insert(binding.id).second) {
            throw ConfigurationError("Duplicate station id '" + binding.id + "'");
        }
        if (!binding.source) {
            throw ConfigurationError("Station '" + binding.id + "' has no decision source");
        }
    }
    if (static_cast<int>(stations_.size()) > pool_.numSlots()) {
        throw ConfigurationError(std::to_string(stations_.size()) + " stations cannot each receive one of " +
                                 std::to_string(pool_.numSlots()) + " slots");
    }
    if (config_.maxRounds < 1) {
        throw ConfigurationError("max_rounds must be at least 1");
    }
    if (config_.demandRefreshInterval < 1) {
        throw ConfigurationError("demand_refresh_interval must be at least 1");
    }
    if (config_.queryTimeout.count() < 1) {
        throw ConfigurationError("query_timeout_ms must be at least 1");
    }
    if (config_.convergenceRounds < 0) {
        throw ConfigurationError("convergence_rounds must not be negative");
    }
}

std::vector<StationId> RoundCoordinator::stationIds() const {
    std::vector<StationId> ids;
    ids.reserve(stations_.size());
    for (const auto& binding : stations_) {
        ids.push_back(binding.id);
    }
    return ids;
}

void RoundCoordinator::overrideDemand(const Demand& demand) {
    if (demand.size() != stations_.size()) {
        throw ConfigurationError("Demand must hold exactly one entry per station");
    }
    for (const auto& binding : stations_) {
        auto it = demand.find(binding.id);
        if (it == demand.end()) {
            throw ConfigurationError("Demand has no entry for station '" + binding.id + "'");
        }
        if (it->second < 1) {
            throw ConfigurationError("Demand for station '" + binding.id + "' must be at least 1");
        }
    }
    demand_ = demand;
    demandPinned_ = true;
}

bool RoundCoordinator::stopRequested() const noexcept {
    return cancelRequested_.load() || (externalStop_ != nullptr && externalStop_->load());
}

bool RoundCoordinator::refreshDue() const {
    if (demandPinned_) {
        return false;
    }
    if (!demand_ || refreshPending_) {
        return true;
    }
    switch (config_.demandRefresh) {
        case DemandRefreshPolicy::EveryRound:
            return true;
        case DemandRefreshPolicy::EveryKRounds:
            return roundsSinceRefresh_ >= config_.demandRefreshInterval;
        case DemandRefreshPolicy::OnSuccess:
            return false;
    }
    return false;
}

std::vector<std::size_t> RoundCoordinator::orderForRound(int round) const {
    std::vector<std::size_t> order(stations_.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    if (config_.stationOrder == StationOrder::RoundRobin && round > 0) {
        const auto shift = static_cast<std::size_t>(round - 1) % order.size();
        std::rotate(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(shift), order.end());
    }
    return order;
}

StationOutcome RoundCoordinator::negotiate(const StationBinding& binding,
                                           int entitlement,
                                           const std::vector<Slot>& claimed) {
    agent::DecisionRequest request;
    request.station = binding.id;
    request.entitlement = entitlement;
    request.numSlots = pool_.numSlots();
    request.round = round_;
    request.demand = *demand_;
    request.heatRanking = pool_.heatRanking();
    request.conflictHistory = pool_.conflictHistory();
    request.claimedSlots = claimed;
    request.previousFeedback = lastFeedback_;

    RawProposal raw;
    std::string reason;
    try {
        const auto reply = binding.source->requestProposal(request, config_.queryTimeout);
        raw = agent::parseProposal(reply);
        if (!raw) {
            reason = "reply carried no usable slot list";
        }
    } catch (const agent::DecisionTimeout& ex) {
        reason = std::string("timeout: ") + ex.what();
    } catch (const std::exception& ex) {
        reason = std::string("decision source error: ") + ex.what();
    }

    auto validation = validator_.validate(raw, entitlement, pool_);

    StationOutcome outcome;
    outcome.candidate = validation.slots;
    outcome.degenerate = validation.degenerate;
    outcome.usedFallback = validation.usedFallback || validation.accepted == 0;
    if (outcome.usedFallback) {
        if (reason.empty()) {
            reason = "reply held no valid slot";
        }
        outcome.fallbackReason = reason;
        spdlog::warn("Round {} station {} uses fallback selection ({})", round_, binding.id, reason);
    } else if (validation.discarded > 0 || validation.backfilled > 0) {
        spdlog::info("Round {} station {} proposal repaired: {} discarded, {} backfilled",
                     round_, binding.id, validation.discarded, validation.backfilled);
    }
    if (outcome.degenerate) {
        spdlog::warn("Round {} station {} entitlement {} exceeds the slot domain; duplicates reintroduced",
                     round_, binding.id, entitlement);
    }
    spdlog::debug("Round {} station {} candidate {}", round_, binding.id, common::formatSlots(outcome.candidate));
    return outcome;
}

std::optional<std::string> RoundCoordinator::persistSuccess(const common::SuccessRecord& record) {
    if (store_ == nullptr) {
        return std::nullopt;
    }
    if (!config_.persistRecords) {
        spdlog::info("Dry run: success record for round {} not persisted", round_);
        return std::nullopt;
    }
    try {
        store_->append(record);
        spdlog::info("Success record persisted to {} ({} total)", store_->path().string(), store_->size());
        return std::nullopt;
    } catch (const std::exception& ex) {
        spdlog::error("Failed to persist success record: {}", ex.what());
        return std::string(ex.what());
    }
}

RoundResult RoundCoordinator::runRound() {
    if (state_ == RoundState::Terminated) {
        throw std::logic_error("RoundCoordinator has terminated");
    }

    state_ = RoundState::Idle;
    ++round_;

    RoundResult result;
    result.round = round_;

    if (refreshDue()) {
        demand_ = planner_.generateDemand(stationIds(), pool_.numSlots());
        roundsSinceRefresh_ = 0;
        refreshPending_ = false;
        result.demandRegenerated = true;
        spdlog::info("Round {} demand regenerated: {}", round_, formatDemand(*demand_));
    } else if (demandPinned_) {
        roundsSinceRefresh_ = 0;
        refreshPending_ = false;
    }
    demandPinned_ = false;
    result.demand = *demand_;
    state_ = RoundState::DemandGenerated;
    spdlog::info("Round {} started, demand {}", round_, formatDemand(result.demand));

    state_ = RoundState::Negotiating;
    std::vector<std::pair<StationId, ValidatedSet>> ordered;
    std::set<Slot> claimed;
    for (std::size_t index : orderForRound(round_)) {
        const auto& binding = stations_[index];
        const int entitlement = result.demand.at(binding.id);
        auto outcome = negotiate(binding, entitlement, std::vector<Slot>(claimed.begin(), claimed.end()));
        claimed.insert(outcome.candidate.begin(), outcome.candidate.end());
        ordered.emplace_back(binding.id, outcome.candidate);
        result.rawProposals[binding.id] = outcome.candidate;
        result.order.push_back(binding.id);
        result.outcomes.emplace(binding.id, std::move(outcome));
    }

    auto resolution = resolver_.resolve(ordered, pool_);
    result.allocation = resolution.allocation;
    result.feedback = pool_.feedback(result.rawProposals, result.allocation);
    result.rawConflictCount = static_cast<int>(result.feedback.conflictSlots.size());
    pool_.recordUsage(result.allocation);
    pool_.recordConflicts(result.rawProposals);
    state_ = RoundState::Resolved;

    int shortfallTotal = 0;
    for (auto& [station, outcome] : result.outcomes) {
        outcome.final = result.allocation.at(station);
        const int entitlement = result.demand.at(station);
        outcome.shortfall = std::max(0, entitlement - static_cast<int>(outcome.final.size()));
        shortfallTotal += outcome.shortfall;
        if (outcome.shortfall > 0) {
            spdlog::warn("Round {} station {} short by {} slot(s)", round_, station, outcome.shortfall);
        }
        spdlog::debug("Round {} station {} final {}", round_, station, common::formatSlots(outcome.final));
    }

    result.success = result.feedback.utilizationRate >= 1.0 && result.rawConflictCount == 0;
    spdlog::info("Round {} utilization {:.3f}, {} raw conflict(s), {} shortfall{}",
                 round_, result.feedback.utilizationRate, result.rawConflictCount, shortfallTotal,
                 result.success ? ", success" : "");

    if (result.success) {
        common::SuccessRecord record;
        record.demand = result.demand;
        record.allocation = result.allocation;
        record.roundsToSuccess = round_ - lastSuccessRound_;
        record.timestamp = common::SuccessRecordStore::formatTimestamp(std::chrono::system_clock::now());
        result.persistenceError = persistSuccess(record);

        lastSuccessRound_ = round_;
        refreshPending_ = true;
        ++consecutiveSuccesses_;
    } else {
        consecutiveSuccesses_ = 0;
    }

    ++roundsSinceRefresh_;
    lastFeedback_ = result.feedback;
    state_ = RoundState::Recorded;
    return result;
}

RunSummary RoundCoordinator::run() {
    RunSummary summary;
    double utilizationSum = 0.0;

    while (true) {
        if (summary.roundsRun >= config_.maxRounds) {
            summary.termination = Termination::MaxRounds;
            break;
        }
        if (stopRequested()) {
            summary.termination = Termination::Cancelled;
            break;
        }

        const auto result = runRound();
        ++summary.roundsRun;
        utilizationSum += result.feedback.utilizationRate;
        summary.totalRawConflicts += result.rawConflictCount;
        for (const auto& [station, outcome] : result.outcomes) {
            if (outcome.usedFallback) {
                ++summary.fallbackCount;
            }
            summary.shortfallTotal += outcome.shortfall;
        }
        if (result.success) {
            ++summary.successRounds;
        }
        if (result.persistenceError) {
            ++summary.persistenceFailures;
        }

        if (config_.convergenceRounds > 0 && consecutiveSuccesses_ >= config_.convergenceRounds) {
            summary.termination = Termination::Converged;
            break;
        }
    }

    if (summary.roundsRun > 0) {
        summary.meanUtilization = utilizationSum / summary.roundsRun;
    }
    state_ = RoundState::Terminated;
    spdlog::info("Run terminated ({}) after {} round(s), {} success round(s)",
                 toString(summary.termination), summary.roundsRun, summary.successRounds);
    return summary;
}

}  // namespace tdma::allocator
