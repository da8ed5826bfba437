#pragma once
#include "plugctl/net/NetConfig.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

/**
 * @brief Run an async operation with a deadline enforced by an Asio timer.
 *
 * Pattern:
 * - Start an async operation and an `asio::steady_timer` on the same executor.
 * - Whichever completes first wins; a timeout cancels the operation through
 *   the caller-supplied `cancel` functor and reports `asio::error::timed_out`.
 * - The calling thread blocks on a condition variable until one side is done.
 *
 * Completion handlers hold a `shared_ptr<State>` so a late handler never
 * touches freed synchronisation primitives after this function has returned.
 *
 * The `io_context` behind `ex` must be running on another thread
 * (see `NetService`), otherwise the wait never completes.
 */
namespace plugctl::net {

template<typename StartAsync, typename Cancel>
error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        error_code ec = asio::error::would_block;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    auto op_handler = [st, timer](const error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) return;
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();
        timer->cancel();
    };

    start_async(op_handler);

    timer->expires_after(timeout);
    timer->async_wait([st, cancel, timer](const error_code& tec) {
        if (tec == asio::error::operation_aborted) {
            return;
        }
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) {
                return;
            }
            st->ec = asio::error::timed_out;
            st->done = true;
        }
        cancel();
        st->cv.notify_one();
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->done; });
    return st->ec;
}

} // namespace plugctl::net
