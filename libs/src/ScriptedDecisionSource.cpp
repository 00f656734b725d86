#include "tdma/agent/ScriptedDecisionSource.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <utility>

namespace tdma::agent {

namespace {

using json = nlohmann::json;

}  // namespace

ScriptedDecisionSource::ScriptedDecisionSource(std::vector<std::string> replies)
    : replies_(std::move(replies)) {}

std::string ScriptedDecisionSource::requestProposal(const DecisionRequest& request,
                                                    std::chrono::milliseconds) {
    requests_.push_back(request);
    if (next_ >= replies_.size()) {
        throw std::runtime_error("Scripted replies exhausted for station " + request.station);
    }
    return replies_[next_++];
}

std::string ScriptedDecisionSource::describe() const {
    return "scripted(" + std::to_string(replies_.size()) + " replies)";
}

std::map<StationId, std::vector<std::string>> loadScriptedReplies(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Scripted reply file not found: " + path.string());
    }
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open scripted reply file: " + path.string());
    }

    json root;
    try {
        input >> root;
    } catch (const json::exception& ex) {
        throw std::runtime_error("Failed to parse scripted reply file (" + path.string() + "): " + ex.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("Scripted reply file must contain an object at the root");
    }

    std::map<StationId, std::vector<std::string>> replies;
    for (const auto& [station, value] : root.items()) {
        if (!value.is_array()) {
            throw std::runtime_error("Scripted replies for '" + station + "' must be an array");
        }
        std::vector<std::string> texts;
        for (const auto& element : value) {
            // Objects are accepted for convenience and replayed as their JSON text.
            texts.push_back(element.is_string() ? element.get<std::string>() : element.dump());
        }
        replies.emplace(station, std::move(texts));
    }
    return replies;
}

}  // namespace tdma::agent
