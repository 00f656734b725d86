#include "tdma/agent/UdpDecisionSource.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/address.hpp>
#include <spdlog/spdlog.h>

#include <optional>
#include <stdexcept>

namespace tdma::agent {

namespace {

boost::asio::ip::address parseAddress(const std::string& host) {
    try {
        return boost::asio::ip::make_address(host);
    } catch (const std::exception& ex) {
        throw std::runtime_error("Invalid decision source address: " + host + " (" + ex.what() + ")");
    }
}

}  // namespace

UdpDecisionSource::UdpDecisionSource(const std::string& host, std::uint16_t port)
    : socket_(ioContext_), destination_(parseAddress(host), port) {
    socket_.open(destination_.protocol());
}

std::string UdpDecisionSource::requestProposal(const DecisionRequest& request,
                                               std::chrono::milliseconds timeout) {
    discardPending();

    const auto payload = request.toJson().dump();
    boost::system::error_code ec;
    socket_.send_to(boost::asio::buffer(payload), destination_, 0, ec);
    if (ec) {
        throw std::runtime_error("Decision request to " + describe() + " failed: " + ec.message());
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) {
            throw DecisionTimeout("No reply from " + describe() + " for station " + request.station);
        }

        std::optional<boost::system::error_code> outcome;
        std::size_t received = 0;
        Endpoint sender;
        socket_.async_receive_from(
            boost::asio::buffer(buffer_),
            sender,
            [&outcome, &received](const boost::system::error_code& error, std::size_t bytes) {
                outcome = error;
                received = bytes;
            });

        ioContext_.restart();
        ioContext_.run_for(remaining);

        if (!outcome) {
            socket_.cancel(ec);
            ioContext_.restart();
            ioContext_.run();
            throw DecisionTimeout("No reply from " + describe() + " for station " + request.station);
        }
        if (*outcome) {
            throw std::runtime_error("Decision reply from " + describe() + " failed: " + outcome->message());
        }
        if (sender != destination_) {
            spdlog::warn("Ignoring datagram from unexpected peer {}:{}",
                         sender.address().to_string(), sender.port());
            continue;
        }
        return std::string(buffer_.data(), received);
    }
}

std::string UdpDecisionSource::describe() const {
    return "udp://" + destination_.address().to_string() + ":" + std::to_string(destination_.port());
}

void UdpDecisionSource::discardPending() {
    boost::system::error_code ec;
    while (socket_.available(ec) > 0 && !ec) {
        Endpoint sender;
        const auto bytes = socket_.receive_from(boost::asio::buffer(buffer_), sender, 0, ec);
        if (ec) {
            break;
        }
        spdlog::debug("Discarded stale {} byte reply from {}:{}",
                      bytes, sender.address().to_string(), sender.port());
    }
}

}  // namespace tdma::agent
