#pragma once
#include "plugctl/net/NetConfig.hpp"

#include <memory>
#include <thread>

namespace plugctl::net {

/**
 * @brief Owns the process-wide `asio::io_context` and the thread that runs it.
 *
 * `TcpClient` blocks its caller while async socket work and deadline timers
 * complete on this loop, so the loop must outlive every client.
 *
 * - A work guard keeps `run()` alive while no operation is pending.
 * - The destructor releases the guard, stops the context and joins the thread.
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

/// Loop shared by every client; started on first use.
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace plugctl::net
