#pragma once
#include "pixelair/net/NetConfig.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

/**
 * @brief Run an async socket operation and block until it completes or a deadline passes.
 *
 * Pattern:
 * - Start the async operation and an `asio::steady_timer` on the same executor.
 * - If the timer fires first it cancels the operation; the caller still waits
 *   for the operation's own handler, so buffers and endpoints the operation
 *   refers to stay valid until it is done with them.
 * - The caller gets `asio::error::timed_out` when the cancelled operation ends
 *   aborted. An operation that completed in the same cycle as the timer keeps
 *   its own result, so a datagram already read is never reported as a timeout.
 * - `transferred`, when given, receives the operation's byte count.
 *
 * Completion handlers hold a `shared_ptr<State>` so late handlers never touch a
 * destroyed wait state. The owning `asio::io_context` must be running on another
 * thread (see `NetService`), otherwise the wait never completes.
 *
 * Receive loops in this library call this with short slices so that a stop flag
 * is observed between slices; a timeout is therefore routine and not logged here.
 */
namespace pixelair::net {

template<typename StartAsync, typename Cancel>
error_code with_deadline(
    asio::any_io_executor ex,
    milliseconds timeout,
    StartAsync start_async,
    Cancel cancel,
    std::size_t* transferred = nullptr)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        bool expired = false;
        error_code ec = asio::error::would_block;
        std::size_t bytes = 0;
    };

    if (timeout.count() < 0) {
        timeout = milliseconds::zero();
    }

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    auto op_handler = [st, timer](const error_code& op_ec, std::size_t n) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) return;
            st->bytes = n;
            st->ec = (st->expired && op_ec == asio::error::operation_aborted)
                ? error_code(asio::error::timed_out)
                : op_ec;
            st->done = true;
        }
        st->cv.notify_one();
        timer->cancel();
    };

    start_async(op_handler);

    timer->expires_after(timeout);
    timer->async_wait([st, cancel, timer](const error_code& tec) {
        if (tec == asio::error::operation_aborted) {
            return; // operation finished first
        }
        std::lock_guard<std::mutex> lk(st->m);
        if (st->done) {
            return;
        }
        // The operation's handler reports the outcome once the cancel lands.
        st->expired = true;
        cancel();
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&] { return st->done; });
    if (transferred) {
        *transferred = st->bytes;
    }
    return st->ec;
}

} // namespace pixelair::net
