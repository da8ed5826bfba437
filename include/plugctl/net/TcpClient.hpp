#pragma once
#include "plugctl/net/NetConfig.hpp"
#include "plugctl/net/Deadline.hpp"
#include "plugctl/net/NetService.hpp"
#include "plugctl/log/Log.hpp"

#include <chrono>
#include <memory>

namespace plugctl::net {
using duration = std::chrono::milliseconds;

/**
 * @brief Blocking TCP client whose every operation is bounded by a deadline.
 *
 * - `connect(...)` tries each endpoint in turn, each attempt bounded by the timeout.
 * - `read_exact(...)` and `write_all(...)` block until done or the deadline fires.
 * - Socket work is serialized by a strand on the shared `NetService` loop.
 *
 * A timed-out operation leaves the socket in an unknown state; callers close
 * and reconnect rather than reuse it.
 */
class TcpClient {
public:
    TcpClient()
    : io_(shared_io_context())
    , socket_(*io_)
    , strand_(asio::make_strand(*io_))
    {}

    ~TcpClient() { close(); }

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    error_code connect(const tcp::endpoint& endpoint, duration timeout) {
        close();
        socket_ = tcp::socket(strand_);
        return connect_one(endpoint, timeout);
    }

    // Resolver results: first endpoint that accepts wins, otherwise the last error.
    error_code connect(const tcp::resolver::results_type& results, duration timeout) {
        error_code last = asio::error::host_not_found;
        for (const auto& entry : results) {
            auto ec = connect(entry.endpoint(), timeout);
            if (!ec) return ec;
            last = ec;
        }
        return last;
    }

    error_code read_exact(void* buf, std::size_t n, duration timeout) {
        auto ex = socket_.get_executor();
        return with_deadline(ex, sanitize(timeout),
            [&](auto completion) {
                asio::async_read(socket_, asio::buffer(buf, n),
                    [completion](const error_code& op_ec, std::size_t) {
                        completion(op_ec);
                    });
            },
            [&]{ cancel(); }
        );
    }

    error_code write_all(const void* buf, std::size_t n, duration timeout) {
        auto ex = socket_.get_executor();
        return with_deadline(ex, sanitize(timeout),
            [&](auto completion) {
                asio::async_write(socket_, asio::buffer(buf, n),
                    [completion](const error_code& op_ec, std::size_t) {
                        completion(op_ec);
                    });
            },
            [&]{ cancel(); }
        );
    }

    // Requests are a single small frame; do not let Nagle hold them back.
    void setNoDelay() {
        error_code ec;
        socket_.set_option(tcp::no_delay(true), ec);
    }

    bool is_open() const { return socket_.is_open(); }

    void cancel() {
        error_code ec;
        socket_.cancel(ec);
    }

    void close() {
        if (!socket_.is_open()) return;
        logInfo("[TcpClient] close()\n");
        error_code ec;
        socket_.cancel(ec);
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

private:
    error_code connect_one(const tcp::endpoint& ep, duration timeout) {
        auto ex = socket_.get_executor();
        return with_deadline(ex, sanitize(timeout),
            [&](auto completion){ socket_.async_connect(ep, completion); },
            [&]{ cancel(); }
        );
    }

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

    std::shared_ptr<asio::io_context> io_;
    tcp::socket socket_;
    asio::strand<asio::io_context::executor_type> strand_;
};

} // namespace plugctl::net
