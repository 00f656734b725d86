#include "tdma/agent/HeuristicDecisionSource.h"
#include "tdma/agent/ResponseParser.h"
#include "tdma/agent/ScriptedDecisionSource.h"
#include "tdma/agent/UdpDecisionSource.h"

#include <catch2/catch_test_macros.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/udp.hpp>

#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using tdma::agent::DecisionRequest;
using tdma::agent::HeuristicConfig;
using tdma::agent::HeuristicDecisionSource;
using tdma::agent::ScriptedDecisionSource;
using tdma::agent::UdpDecisionSource;
using tdma::common::Slot;

namespace {

DecisionRequest makeRequest(int entitlement, int numSlots) {
    DecisionRequest request;
    request.station = "AP1";
    request.entitlement = entitlement;
    request.numSlots = numSlots;
    request.round = 3;
    request.demand = {{"AP1", entitlement}};
    for (Slot slot = 0; slot < numSlots; ++slot) {
        request.heatRanking.emplace_back(slot, 0);
    }
    return request;
}

std::vector<int> parsedSlots(const std::string& reply) {
    const auto entries = tdma::agent::parseProposal(reply);
    REQUIRE(entries.has_value());
    std::vector<int> slots;
    for (const auto& entry : *entries) {
        slots.push_back(entry.get<int>());
    }
    return slots;
}

}  // namespace

TEST_CASE("DecisionRequest serializes the agent context", "[agent]") {
    auto request = makeRequest(2, 4);
    request.heatRanking = {{3, 0}, {0, 1}, {1, 2}, {2, 2}};
    request.conflictHistory = {{1, 3}};
    request.claimedSlots = {0, 3};

    auto node = request.toJson();
    CHECK(node["station"] == "AP1");
    CHECK(node["entitlement"] == 2);
    CHECK(node["num_slots"] == 4);
    CHECK(node["heat_ranking"][0] == nlohmann::json::array({3, 0}));
    CHECK(node["conflict_history"]["1"] == 3);
    CHECK(node["claimed_slots"] == nlohmann::json::array({0, 3}));
    CHECK(node["feedback"].is_null());

    tdma::common::Feedback feedback;
    feedback.conflictSlots = {1};
    feedback.conflictDetails = {{1, {"AP1", "AP2"}}};
    feedback.idleSlots = {2};
    feedback.usedSlots = 3;
    feedback.utilizationRate = 0.75;
    request.previousFeedback = feedback;
    node = request.toJson();
    CHECK(node["feedback"]["conflict_slots"] == nlohmann::json::array({1}));
    CHECK(node["feedback"]["conflict_details"]["1"] == nlohmann::json::array({"AP1", "AP2"}));
    CHECK(node["feedback"]["utilization_rate"] == 0.75);
}

TEST_CASE("ScriptedDecisionSource replays replies in order", "[agent]") {
    ScriptedDecisionSource source({"first", "second"});
    const auto request = makeRequest(1, 4);

    CHECK(source.requestProposal(request, std::chrono::milliseconds(10)) == "first");
    CHECK(source.requestProposal(request, std::chrono::milliseconds(10)) == "second");
    CHECK(source.served() == 2);
    CHECK(source.remaining() == 0);
    REQUIRE_THROWS_AS(source.requestProposal(request, std::chrono::milliseconds(10)), std::runtime_error);
    CHECK(source.requests().size() == 3);
}

TEST_CASE("Scripted reply files", "[agent]") {
    const auto path = std::filesystem::temp_directory_path() /
                      ("tdma-replies-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                       ".json");

    SECTION("strings and objects") {
        {
            std::ofstream output(path);
            output << R"({"AP1": ["{\"channels\": [1]}", {"slots": [2, 3]}], "AP2": []})";
        }
        const auto replies = tdma::agent::loadScriptedReplies(path);
        REQUIRE(replies.size() == 2);
        REQUIRE(replies.at("AP1").size() == 2);
        CHECK(parsedSlots(replies.at("AP1")[0]) == std::vector<int>{1});
        CHECK(parsedSlots(replies.at("AP1")[1]) == std::vector<int>{2, 3});
        CHECK(replies.at("AP2").empty());
    }

    SECTION("wrong root") {
        {
            std::ofstream output(path);
            output << "[1, 2]";
        }
        REQUIRE_THROWS_AS(tdma::agent::loadScriptedReplies(path), std::runtime_error);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(tdma::agent::loadScriptedReplies(path.string() + ".absent"), std::runtime_error);
    }

    std::filesystem::remove(path);
}

TEST_CASE("HeuristicDecisionSource proposes the coolest unclaimed slots", "[agent]") {
    HeuristicConfig config;
    config.seed = 11;
    HeuristicDecisionSource source(config);

    auto request = makeRequest(3, 6);
    request.heatRanking = {{4, 0}, {5, 0}, {0, 1}, {1, 1}, {2, 2}, {3, 2}};
    request.claimedSlots = {5};

    // Every reply style must survive the tolerant parser.
    for (int i = 0; i < 12; ++i) {
        const auto slots = parsedSlots(source.requestProposal(request, std::chrono::milliseconds(10)));
        CHECK(slots == std::vector<int>{4, 0, 1});
    }
}

TEST_CASE("HeuristicDecisionSource contends when every slot is claimed", "[agent]") {
    HeuristicConfig config;
    config.seed = 2;
    HeuristicDecisionSource source(config);

    auto request = makeRequest(2, 3);
    request.claimedSlots = {0, 1, 2};
    const auto slots = parsedSlots(source.requestProposal(request, std::chrono::milliseconds(10)));
    CHECK(slots == std::vector<int>{0, 1});
}

TEST_CASE("HeuristicDecisionSource noise and malformed replies", "[agent]") {
    SECTION("malformed replies carry no structure") {
        HeuristicConfig config;
        config.malformedRate = 1.0;
        config.seed = 4;
        HeuristicDecisionSource source(config);
        const auto reply = source.requestProposal(makeRequest(2, 5), std::chrono::milliseconds(10));
        CHECK_FALSE(tdma::agent::parseProposal(reply).has_value());
    }

    SECTION("noisy picks stay in range") {
        HeuristicConfig config;
        config.noise = 1.0;
        config.seed = 8;
        HeuristicDecisionSource source(config);
        for (int i = 0; i < 20; ++i) {
            for (int slot : parsedSlots(source.requestProposal(makeRequest(3, 5), std::chrono::milliseconds(10)))) {
                CHECK(slot >= 0);
                CHECK(slot < 5);
            }
        }
    }

    SECTION("probabilities are validated") {
        HeuristicConfig config;
        config.noise = 1.5;
        REQUIRE_THROWS_AS(HeuristicDecisionSource(config), std::invalid_argument);
    }
}

TEST_CASE("UdpDecisionSource exchanges one datagram per request", "[agent][udp]") {
    namespace asio = boost::asio;
    asio::io_context bridgeContext;
    asio::ip::udp::socket bridge(bridgeContext,
                                 asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const auto port = bridge.local_endpoint().port();

    SECTION("reply arrives") {
        std::string seenStation;
        std::thread responder([&]() {
            std::array<char, 65507> buffer{};
            asio::ip::udp::endpoint sender;
            const auto bytes = bridge.receive_from(asio::buffer(buffer), sender);
            const auto request = nlohmann::json::parse(std::string(buffer.data(), bytes));
            seenStation = request.at("station").get<std::string>();
            const std::string reply = R"(Picking quietly: {"channels": [2, 4]})";
            bridge.send_to(asio::buffer(reply), sender);
        });

        UdpDecisionSource source("127.0.0.1", port);
        const auto reply = source.requestProposal(makeRequest(2, 6), std::chrono::milliseconds(2000));
        responder.join();

        CHECK(seenStation == "AP1");
        CHECK(parsedSlots(reply) == std::vector<int>{2, 4});
        CHECK(source.describe() == "udp://127.0.0.1:" + std::to_string(port));
    }

    SECTION("silent bridge times out") {
        UdpDecisionSource source("127.0.0.1", port);
        const auto started = std::chrono::steady_clock::now();
        REQUIRE_THROWS_AS(source.requestProposal(makeRequest(1, 4), std::chrono::milliseconds(50)),
                          tdma::agent::DecisionTimeout);
        CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
    }

    SECTION("invalid host") {
        REQUIRE_THROWS_AS(UdpDecisionSource("not-an-address", 9500), std::runtime_error);
    }
}
