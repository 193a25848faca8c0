#pragma once

#include "security/ModerationResult.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace security {

// Sliding-window admission per session. Each session owns its own lock, so
// callers on different sessions only contend for the short map lookup.
class SessionRateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using ClockSource = std::function<Clock::time_point()>;

    struct Admission {
        bool admitted = false;
        std::size_t messagesInWindow = 0;
        std::chrono::seconds retryAfter{0};
    };

    SessionRateLimiter(std::size_t maxMessages, std::chrono::seconds window, ClockSource clock = nullptr);

    SessionRateLimiter(const SessionRateLimiter&) = delete;
    SessionRateLimiter& operator=(const SessionRateLimiter&) = delete;

    // Evicts expired timestamps, then records now if the window has room.
    // Eviction, count and record happen under the session lock as one step.
    Admission TryAcquire(const std::string& sessionId);

    // Records now without checking the limit.
    void Record(const std::string& sessionId);

    SessionStats GetStats(const std::string& sessionId) const;
    bool Reset(const std::string& sessionId);

    // Drops sessions with no message newer than now - idle.
    std::size_t PurgeIdle(std::chrono::seconds idle);

    std::size_t SessionCount() const;
    std::size_t GetMaxMessages() const { return maxMessages_; }
    std::chrono::seconds GetWindow() const { return window_; }

private:
    struct SessionWindow {
        std::mutex mutex;
        std::deque<Clock::time_point> timestamps;
        // Set once the entry has left the map; holders must look the session up again.
        bool retired = false;
    };

    std::shared_ptr<SessionWindow> GetOrCreateWindow(const std::string& sessionId);
    std::shared_ptr<SessionWindow> FindWindow(const std::string& sessionId) const;

    void EvictExpired(SessionWindow& window, Clock::time_point now) const;
    void Append(SessionWindow& window, Clock::time_point now) const;

    std::size_t maxMessages_;
    std::chrono::seconds window_;
    ClockSource clock_;

    mutable std::mutex sessionsMutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionWindow>> sessions_;
};

} // namespace security
