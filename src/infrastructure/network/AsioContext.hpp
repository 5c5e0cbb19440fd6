#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace rackscan::infra {

/**
 * @brief Owns the io_context that drives sockets, resolvers and timers.
 *
 * A fixed set of worker threads runs the context. A work guard keeps them
 * alive while no operation is pending, so probes and scheduler timers can be
 * started at any time between start() and stop().
 *
 * Handlers run on these threads must not block on other asynchronous work
 * of the same context.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (at least one is used).
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Releases the work guard, stops the context and joins the workers.
     *
     * The context is restarted afterwards so that start() may be called again.
     */
    void stop();

    /**
     * @brief Checks whether worker threads are running.
     * @return True between start() and stop().
     */
    bool isRunning() const { return running_.load(); }

    /**
     * @brief Returns a reference to the underlying Asio io_context.
     * @return Reference to the asio::io_context.
     */
    asio::io_context& getContext() { return ioContext_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace rackscan::infra
