#pragma once

#include "vouchnet/log/StructuredLogger.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace vouchnet::persistence {

// Runs one batch of peer transfers concurrently under a shared deadline.
// A transfer that misses the deadline counts as no response; its thread is
// parked and joined when the pool is drained or destroyed.
class TransferPool {
public:
    explicit TransferPool(std::chrono::milliseconds timeout)
        : timeout_(timeout) {}

    ~TransferPool() { drain(); }

    TransferPool(const TransferPool&) = delete;
    TransferPool& operator=(const TransferPool&) = delete;

    template <typename T>
    std::vector<std::optional<T>> run(std::vector<std::function<std::optional<T>()>> tasks) {
        std::vector<std::future<std::optional<T>>> pending;
        pending.reserve(tasks.size());
        for (auto& task : tasks) {
            pending.push_back(std::async(std::launch::async, std::move(task)));
        }

        const auto deadline = std::chrono::steady_clock::now() + timeout_;
        std::vector<std::optional<T>> results;
        results.reserve(pending.size());
        for (auto& future : pending) {
            if (future.wait_until(deadline) != std::future_status::ready) {
                results.push_back(std::nullopt);
                park(std::move(future));
                continue;
            }
            try {
                results.push_back(future.get());
            } catch (const std::exception& ex) {
                log::StructuredLogger::instance().warning("transfer.failed", {{"error", ex.what()}});
                results.push_back(std::nullopt);
            }
        }
        return results;
    }

    void drain() {
        std::vector<std::function<void()>> waiters;
        {
            std::scoped_lock lock(mutex_);
            waiters.swap(stragglers_);
        }
        for (auto& wait : waiters) {
            wait();
        }
    }

    std::size_t timed_out() const {
        std::scoped_lock lock(mutex_);
        return timed_out_;
    }

    std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
    template <typename T>
    void park(std::future<T> future) {
        auto held = std::make_shared<std::future<T>>(std::move(future));
        std::scoped_lock lock(mutex_);
        ++timed_out_;
        stragglers_.push_back([held]() { held->wait(); });
    }

    std::chrono::milliseconds timeout_;
    mutable std::mutex mutex_;
    std::vector<std::function<void()>> stragglers_;
    std::size_t timed_out_{0};
};

}  // namespace vouchnet::persistence
