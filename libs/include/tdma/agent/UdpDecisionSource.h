#pragma once

#include "tdma/agent/DecisionSource.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace tdma::agent {

/**
 * @brief Talks to an external agent bridge over UDP.
 *
 * Each request is one datagram holding DecisionRequest::toJson(); the bridge
 * answers with one datagram of free-form text. Datagrams from other peers
 * and replies left over from an earlier timed-out request are discarded.
 */
class UdpDecisionSource : public DecisionSource {
public:
    using Endpoint = boost::asio::ip::udp::endpoint;

    UdpDecisionSource(const std::string& host, std::uint16_t port);

    UdpDecisionSource(const UdpDecisionSource&) = delete;
    UdpDecisionSource& operator=(const UdpDecisionSource&) = delete;

    std::string requestProposal(const DecisionRequest& request,
                                std::chrono::milliseconds timeout) override;

    std::string describe() const override;

    const Endpoint& endpoint() const noexcept { return destination_; }

private:
    void discardPending();

    boost::asio::io_context ioContext_;
    boost::asio::ip::udp::socket socket_;
    Endpoint destination_;
    std::array<char, 65507> buffer_{};
};

}  // namespace tdma::agent
