#pragma once
#include "pixelair/net/NetConfig.hpp"

#include <memory>
#include <thread>

namespace pixelair::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * Every blocking socket helper in this library (`with_deadline`) waits for
 * completions that are dispatched by this thread, so a NetService must outlive
 * the sockets created from `io()` while they are in use.
 *
 * Lifetime notes:
 * - The client creates one NetService on its first acquisition and destroys it
 *   after the last release, once all sockets are closed.
 * - The destructor releases the work guard, stops the context and joins.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

} // namespace pixelair::net
