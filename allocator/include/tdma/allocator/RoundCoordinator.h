#pragma once

#include "tdma/agent/DecisionSource.h"
#include "tdma/allocator/ConflictResolver.h"
#include "tdma/allocator/DemandPlanner.h"
#include "tdma/allocator/ProposalValidator.h"
#include "tdma/allocator/ResourcePool.h"
#include "tdma/common/SuccessRecordStore.h"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tdma::allocator {

enum class RoundState {
    Idle,
    DemandGenerated,
    Negotiating,
    Resolved,
    Recorded,
    Terminated,
};

enum class DemandRefreshPolicy {
    OnSuccess,
    EveryRound,
    EveryKRounds,
};

enum class StationOrder {
    Fixed,
    RoundRobin,
};

enum class Termination {
    MaxRounds,
    Cancelled,
    Converged,
};

std::string toString(RoundState state);
std::string toString(DemandRefreshPolicy policy);
std::string toString(StationOrder order);
std::string toString(Termination termination);

DemandRefreshPolicy parseDemandRefreshPolicy(const std::string& name);
StationOrder parseStationOrder(const std::string& name);

struct CoordinatorConfig {
    int maxRounds{100};
    DemandRefreshPolicy demandRefresh{DemandRefreshPolicy::OnSuccess};
    int demandRefreshInterval{1};
    StationOrder stationOrder{StationOrder::Fixed};
    std::chrono::milliseconds queryTimeout{5000};
    int convergenceRounds{0};
    bool persistRecords{true};
};

struct StationBinding {
    StationId id;
    std::shared_ptr<agent::DecisionSource> source;
};

struct StationOutcome {
    ValidatedSet candidate;
    std::vector<Slot> final;
    int shortfall{0};
    bool usedFallback{false};
    bool degenerate{false};
    std::string fallbackReason;
};

struct RoundResult {
    int round{0};
    Demand demand;
    bool demandRegenerated{false};
    std::vector<StationId> order;
    std::map<StationId, StationOutcome> outcomes;
    Allocation rawProposals;   // validated candidate sets before resolution
    Allocation allocation;
    Feedback feedback;
    int rawConflictCount{0};
    bool success{false};
    std::optional<std::string> persistenceError;
};

struct RunSummary {
    int roundsRun{0};
    int successRounds{0};
    int totalRawConflicts{0};
    double meanUtilization{0.0};
    int fallbackCount{0};
    int shortfallTotal{0};
    int persistenceFailures{0};
    Termination termination{Termination::MaxRounds};
};

/**
 * @brief Drives the round loop: demand, negotiation, resolution, bookkeeping.
 *
 * Single-threaded. Stations are queried one after another and every error a
 * decision source raises degrades that station to the validator fallback.
 * The pool, planner, validator, resolver and store are owned by the caller
 * and must outlive the coordinator. Only configuration problems throw.
 */
class RoundCoordinator {
public:
    RoundCoordinator(CoordinatorConfig config,
                     std::vector<StationBinding> stations,
                     ResourcePool& pool,
                     DemandPlanner& planner,
                     ProposalValidator& validator,
                     ConflictResolver& resolver,
                     common::SuccessRecordStore* store = nullptr);

    // Pins the demand for the next round. Every station needs an entry >= 1;
    // the sum may exceed the pool to model oversubscription.
    void overrideDemand(const Demand& demand);

    RoundResult runRound();

    // Runs rounds until maxRounds, cancellation or convergence.
    RunSummary run();

    // Checked between rounds; the round in flight always completes.
    void cancel() noexcept { cancelRequested_.store(true); }

    // Additional stop flag polled between rounds, e.g. one set from a signal handler.
    void bindStopFlag(const std::atomic_bool* flag) noexcept { externalStop_ = flag; }

    RoundState state() const noexcept { return state_; }
    int currentRound() const noexcept { return round_; }
    const std::optional<Demand>& demand() const noexcept { return demand_; }
    const ResourcePool& pool() const noexcept { return pool_; }
    std::vector<StationId> stationIds() const;

private:
    bool stopRequested() const noexcept;
    bool refreshDue() const;
    std::vector<std::size_t> orderForRound(int round) const;
    StationOutcome negotiate(const StationBinding& binding, int entitlement, const std::vector<Slot>& claimed);
    std::optional<std::string> persistSuccess(const common::SuccessRecord& record);

    CoordinatorConfig config_;
    std::vector<StationBinding> stations_;
    ResourcePool& pool_;
    DemandPlanner& planner_;
    ProposalValidator& validator_;
    ConflictResolver& resolver_;
    common::SuccessRecordStore* store_;

    RoundState state_{RoundState::Idle};
    int round_{0};
    int lastSuccessRound_{0};
    int roundsSinceRefresh_{0};
    int consecutiveSuccesses_{0};
    bool refreshPending_{true};
    bool demandPinned_{false};
    std::optional<Demand> demand_;
    std::optional<Feedback> lastFeedback_;

    std::atomic_bool cancelRequested_{false};
    const std::atomic_bool* externalStop_{nullptr};
};

}  // namespace tdma::allocator
