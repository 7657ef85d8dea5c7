#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace NetLink {

/**
 * @brief Cooperative suspend/resume switch consulted by a sender loop
 *
 * One controller calls pause()/resume(), the chunk loop calls
 * waitIfPaused() before each write. Waiting blocks on a condition
 * variable, never spins. close() releases every waiter for good.
 */
class PauseGate {
public:
    PauseGate() = default;
    PauseGate(const PauseGate&) = delete;
    PauseGate& operator=(const PauseGate&) = delete;

    void pause();
    void resume();
    bool isPaused() const;

    /**
     * @brief Block while paused
     * @return false if the gate was closed, true once it is open
     */
    bool waitIfPaused();

    /**
     * @brief Block while paused, at most timeout
     * @return true if the gate is open, false on timeout or close
     */
    bool waitIfPaused(std::chrono::milliseconds timeout);

    void close();
    bool isClosed() const;

    /// Re-open a closed gate, clearing the paused flag
    void reset();

    /// Number of loops currently blocked in waitIfPaused
    int waiters() const;

    uint64_t pauseCount() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool paused_{false};
    bool closed_{false};
    int waiters_{0};
    uint64_t pauseCount_{0};
};

} // namespace NetLink
