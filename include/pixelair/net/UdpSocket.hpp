#pragma once
#include "pixelair/net/NetConfig.hpp"
#include "pixelair/net/Deadline.hpp"

#include <cstdint>
#include <memory>

namespace pixelair::net {

/**
 * UdpSocket
 *
 * Datagram socket used for discovery broadcasts, state reports and OSC commands.
 *
 * - `send_to` / `recv_from` block the caller but never longer than the given
 *   timeout (`with_deadline` on the socket's executor).
 * - The socket keeps its `io_context` alive through a shared pointer; the
 *   context must be run by a `NetService`.
 * - A single UdpSocket must not be used from two threads at once; callers that
 *   share one serialise access themselves.
 */
class UdpSocket {
public:
    explicit UdpSocket(std::shared_ptr<asio::io_context> io)
    : io_(std::move(io)), sock_(*io_) {}

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    ~UdpSocket() { close(); }

    error_code open_v4() {
        error_code ec;
        sock_.open(udp::v4(), ec);
        return ec;
    }

    /// Bind to all interfaces. Port 0 lets the OS choose.
    error_code bind_any(std::uint16_t port) {
        error_code ec;
        sock_.bind(udp::endpoint(udp::v4(), port), ec);
        return ec;
    }

    error_code enable_broadcast(bool on = true) {
        error_code ec;
        sock_.set_option(asio::socket_base::broadcast(on), ec);
        return ec;
    }


    /// Open, optionally enable broadcast, and bind in one step.
    error_code open_and_bind(std::uint16_t port, bool broadcast) {
        if (auto ec = open_v4()) return ec;
        if (broadcast) {
            if (auto ec = enable_broadcast(true)) return ec;
        }
        return bind_any(port);
    }

    // Send a datagram, fail if not sent within timeout.
    error_code send_to(const void* data, std::size_t n,
                       const udp::endpoint& ep, milliseconds timeout) {
        auto ex = sock_.get_executor();
        return with_deadline(ex, timeout,
            [&](auto cb) { sock_.async_send_to(asio::buffer(data, n), ep, 0, cb); },
            [this] { cancel(); });
    }

    // Receive one datagram, with timeout. Fills out_ep and out_n on success.
    // Returns only after the receive itself has finished with the buffer.
    error_code recv_from(void* data, std::size_t max,
                         udp::endpoint& out_ep, std::size_t& out_n,
                         milliseconds timeout) {
        auto ex = sock_.get_executor();
        out_n = 0;
        return with_deadline(ex, timeout,
            [&](auto cb) { sock_.async_receive_from(asio::buffer(data, max), out_ep, 0, cb); },
            [this] { cancel(); },
            &out_n);
    }

    std::uint16_t local_port() const {
        error_code ec;
        auto ep = sock_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    bool is_open() const { return sock_.is_open(); }

    void cancel() {
        error_code ignore;
        sock_.cancel(ignore);
    }

    void close() {
        if (!sock_.is_open()) return;
        error_code ignore;
        sock_.cancel(ignore);
        sock_.close(ignore);
    }

private:
    std::shared_ptr<asio::io_context> io_;
    udp::socket sock_;
};

} // namespace pixelair::net
