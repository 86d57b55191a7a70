#pragma once

#include "pixelair/net/UdpSocket.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace pixelair::client {

/**
 * @brief Outbound datagram path used by the command sender.
 *
 * Kept abstract so the retry logic can be exercised against a recording
 * transport without sockets.
 */
class CommandTransport {
public:
    virtual ~CommandTransport() = default;

    virtual net::error_code send(const net::udp::endpoint& destination,
                                 const std::vector<std::uint8_t>& payload) = 0;
};

/// Sends through one shared UDP socket; concurrent senders are serialised.
class UdpCommandTransport : public CommandTransport {
public:
    UdpCommandTransport(std::shared_ptr<net::UdpSocket> socket, net::milliseconds sendTimeout);

    net::error_code send(const net::udp::endpoint& destination,
                         const std::vector<std::uint8_t>& payload) override;

    /// Close the socket once no send is using it.
    void close();

private:
    std::shared_ptr<net::UdpSocket> socket_;
    net::milliseconds sendTimeout_;
    std::mutex mutex_;
};

} // namespace pixelair::client
