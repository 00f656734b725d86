#include "tdma/agent/HeuristicDecisionSource.h"

#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

namespace tdma::agent {

namespace {

std::string joinSlots(const std::vector<Slot>& slots) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << slots[i];
    }
    return oss.str();
}

}  // namespace

HeuristicDecisionSource::HeuristicDecisionSource(HeuristicConfig config)
    : config_(config),
      rng_(config.seed.value_or(std::random_device{}())) {
    if (config_.noise < 0.0 || config_.noise > 1.0) {
        throw std::invalid_argument("Heuristic noise must be within [0, 1]");
    }
    if (config_.malformedRate < 0.0 || config_.malformedRate > 1.0) {
        throw std::invalid_argument("Heuristic malformed_rate must be within [0, 1]");
    }
}

std::string HeuristicDecisionSource::requestProposal(const DecisionRequest& request,
                                                     std::chrono::milliseconds) {
    if (roll(config_.malformedRate)) {
        return "After reviewing the heat ranking I would lean towards the quieter edge slots, "
               "but the current picture is unclear.";
    }
    return render(choose(request), request);
}

std::string HeuristicDecisionSource::describe() const {
    std::ostringstream oss;
    oss << "heuristic(noise=" << config_.noise << ", malformed_rate=" << config_.malformedRate << ")";
    return oss.str();
}

std::vector<Slot> HeuristicDecisionSource::choose(const DecisionRequest& request) {
    const std::set<Slot> claimed(request.claimedSlots.begin(), request.claimedSlots.end());
    const auto want = static_cast<std::size_t>(std::max(request.entitlement, 0));

    std::vector<Slot> ranked;
    ranked.reserve(static_cast<std::size_t>(std::max(request.numSlots, 0)));
    for (const auto& entry : request.heatRanking) {
        ranked.push_back(entry.first);
    }
    if (ranked.empty()) {
        for (Slot slot = 0; slot < request.numSlots; ++slot) {
            ranked.push_back(slot);
        }
    }

    std::vector<Slot> picks;
    for (Slot slot : ranked) {
        if (picks.size() >= want) {
            break;
        }
        if (claimed.count(slot) == 0) {
            picks.push_back(slot);
        }
    }
    // Not enough unclaimed slots left: contend for claimed ones.
    for (Slot slot : ranked) {
        if (picks.size() >= want) {
            break;
        }
        if (std::find(picks.begin(), picks.end(), slot) == picks.end()) {
            picks.push_back(slot);
        }
    }

    if (!picks.empty() && request.numSlots > 0 && roll(config_.noise)) {
        std::uniform_int_distribution<std::size_t> which(0, picks.size() - 1);
        std::uniform_int_distribution<Slot> any(0, request.numSlots - 1);
        picks[which(rng_)] = any(rng_);
    }
    return picks;
}

std::string HeuristicDecisionSource::render(const std::vector<Slot>& slots,
                                            const DecisionRequest& request) {
    std::uniform_int_distribution<int> style(0, 2);
    std::ostringstream oss;
    switch (style(rng_)) {
        case 0:
            oss << "Choosing the least used slots for " << request.station << ". "
                << R"({"channels": [)" << joinSlots(slots)
                << R"(], "reason": "lowest heat first"})";
            break;
        case 1:
            oss << "{'channels': [" << joinSlots(slots) << "], 'reason': 'avoid claimed slots',}";
            break;
        default:
            oss << "```json\n{channels: [" << joinSlots(slots) << "], reason: \"round "
                << request.round << "\"}\n```";
            break;
    }
    return oss.str();
}

bool HeuristicDecisionSource::roll(double probability) {
    if (probability <= 0.0) {
        return false;
    }
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_) < probability;
}

}  // namespace tdma::agent
