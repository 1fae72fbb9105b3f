/**
 * @file threading.hpp
 * @brief Thread and synchronization wrappers used by the relay
 *
 * Provides:
 * - Named threads (the pump runs on one, visible in top/htop)
 * - Mutex, scoped locks and condition variables
 *
 * All relay state is owned by the pump thread; these primitives are only
 * used to hand stop requests and completion notices between threads.
 */

#pragma once

#include <thread>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <string>

#include <pthread.h>

namespace fidasrelay {

/**
 * @brief Thread configuration
 */
struct ThreadConfig {
    std::string name{"unnamed"};  ///< Truncated to 15 chars by the kernel
};

/**
 * @brief Named thread wrapper
 *
 * Abstraction over std::thread that names the OS thread and joins on
 * destruction.
 *
 * Usage:
 *   Thread worker(ThreadConfig{.name = "pump"});
 *   worker.start([&]{ pump.run(); });
 *   worker.join();
 */
class Thread {
public:
    Thread() = default;

    /**
     * @brief Create thread without starting (call start() later)
     */
    explicit Thread(const ThreadConfig& config)
        : config_(config) {
    }

    /**
     * @brief Destructor - joins if joinable
     */
    ~Thread() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    // Non-copyable, non-movable (the running lambda captures this)
    Thread(const Thread&) = delete;
    Thread& operator=(const Thread&) = delete;

    /**
     * @brief Start thread with function (if not already started)
     */
    template<typename Func>
    void start(Func&& func) {
        if (thread_.joinable()) {
            return;  // Already running
        }
        thread_ = std::thread([this, f = std::forward<Func>(func)]() mutable {
            this->thread_function(std::move(f));
        });
    }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    /**
     * @brief Detach thread
     *
     * Used when a shutdown grace period expires and the process is about
     * to exit without waiting for the thread.
     */
    void detach() {
        if (thread_.joinable()) {
            thread_.detach();
        }
    }

    bool joinable() const noexcept {
        return thread_.joinable();
    }

private:
    template<typename Func>
    void thread_function(Func&& func) {
#ifdef __linux__
        if (!config_.name.empty()) {
            pthread_setname_np(pthread_self(), config_.name.substr(0, 15).c_str());
        }
#endif
        func();
    }

    ThreadConfig config_;
    std::thread thread_;
};

/**
 * @brief Mutex wrapper
 */
class Mutex {
public:
    Mutex() = default;
    ~Mutex() = default;

    // Non-copyable, non-movable
    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock() { mutex_.lock(); }
    void unlock() { mutex_.unlock(); }

private:
    std::mutex mutex_;
};

using Lock = std::lock_guard<Mutex>;
using UniqueLock = std::unique_lock<Mutex>;

/**
 * @brief Condition variable wrapper
 *
 * std::condition_variable_any because Mutex is not std::mutex.
 */
class ConditionVariable {
public:
    ConditionVariable() = default;
    ~ConditionVariable() = default;

    // Non-copyable, non-movable
    ConditionVariable(const ConditionVariable&) = delete;
    ConditionVariable& operator=(const ConditionVariable&) = delete;

    void notify_all() noexcept { cv_.notify_all(); }

    template<typename Predicate>
    void wait(UniqueLock& lock, Predicate pred) {
        cv_.wait(lock, pred);
    }

    /**
     * @brief Wait until pred holds or rel_time elapses
     * @return Value of pred on return
     */
    template<typename Rep, typename Period, typename Predicate>
    bool wait_for(UniqueLock& lock,
                  const std::chrono::duration<Rep, Period>& rel_time,
                  Predicate pred) {
        return cv_.wait_for(lock, rel_time, pred);
    }

private:
    std::condition_variable_any cv_;
};

} // namespace fidasrelay
