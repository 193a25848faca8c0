#include "security/SessionRateLimiter.hpp"

#include <algorithm>
#include <utility>

namespace security {

SessionRateLimiter::SessionRateLimiter(std::size_t maxMessages, std::chrono::seconds window, ClockSource clock)
    : maxMessages_{maxMessages}
    , window_{window}
    , clock_{clock ? std::move(clock) : ClockSource{[]() { return Clock::now(); }}} {}

SessionRateLimiter::Admission SessionRateLimiter::TryAcquire(const std::string& sessionId) {
    for (;;) {
        auto window = GetOrCreateWindow(sessionId);
        std::lock_guard<std::mutex> lock{window->mutex};
        if (window->retired) {
            continue;
        }

        const auto now = clock_();
        EvictExpired(*window, now);

        Admission admission;
        admission.messagesInWindow = window->timestamps.size();

        if (window->timestamps.size() >= maxMessages_) {
            const auto oldest = window->timestamps.front();
            admission.retryAfter = std::chrono::duration_cast<std::chrono::seconds>(oldest + window_ - now);
            return admission;
        }

        Append(*window, now);
        admission.admitted = true;
        admission.messagesInWindow = window->timestamps.size();
        return admission;
    }
}

void SessionRateLimiter::Record(const std::string& sessionId) {
    for (;;) {
        auto window = GetOrCreateWindow(sessionId);
        std::lock_guard<std::mutex> lock{window->mutex};
        if (window->retired) {
            continue;
        }

        Append(*window, clock_());
        return;
    }
}

SessionStats SessionRateLimiter::GetStats(const std::string& sessionId) const {
    SessionStats stats;
    stats.sessionId = sessionId;
    stats.limit = maxMessages_;
    stats.window = window_;

    auto window = FindWindow(sessionId);
    if (window) {
        std::lock_guard<std::mutex> lock{window->mutex};
        const auto cutoff = clock_() - window_;
        stats.messagesInWindow = static_cast<std::size_t>(std::count_if(std::begin(window->timestamps),
            std::end(window->timestamps), [cutoff](const Clock::time_point& t) { return t >= cutoff; }));
    }

    stats.remaining = stats.messagesInWindow >= maxMessages_ ? 0 : maxMessages_ - stats.messagesInWindow;
    return stats;
}

bool SessionRateLimiter::Reset(const std::string& sessionId) {
    std::lock_guard<std::mutex> sessionsLock{sessionsMutex_};

    auto iter = sessions_.find(sessionId);
    if (iter == sessions_.end()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> windowLock{iter->second->mutex};
        iter->second->retired = true;
    }

    sessions_.erase(iter);
    return true;
}

std::size_t SessionRateLimiter::PurgeIdle(std::chrono::seconds idle) {
    std::lock_guard<std::mutex> sessionsLock{sessionsMutex_};

    const auto cutoff = clock_() - idle;
    std::size_t removed = 0;

    for (auto iter = sessions_.begin(); iter != sessions_.end();) {
        auto& window = *iter->second;
        std::lock_guard<std::mutex> windowLock{window.mutex};

        if (window.timestamps.empty() || window.timestamps.back() < cutoff) {
            window.retired = true;
            iter = sessions_.erase(iter);
            ++removed;
        } else {
            ++iter;
        }
    }

    return removed;
}

std::size_t SessionRateLimiter::SessionCount() const {
    std::lock_guard<std::mutex> lock{sessionsMutex_};
    return sessions_.size();
}

std::shared_ptr<SessionRateLimiter::SessionWindow> SessionRateLimiter::GetOrCreateWindow(
    const std::string& sessionId) {
    std::lock_guard<std::mutex> lock{sessionsMutex_};

    auto& window = sessions_[sessionId];
    if (!window) {
        window = std::make_shared<SessionWindow>();
    }

    return window;
}

std::shared_ptr<SessionRateLimiter::SessionWindow> SessionRateLimiter::FindWindow(
    const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock{sessionsMutex_};

    auto iter = sessions_.find(sessionId);
    return iter == sessions_.end() ? nullptr : iter->second;
}

void SessionRateLimiter::EvictExpired(SessionWindow& window, Clock::time_point now) const {
    const auto cutoff = now - window_;
    while (!window.timestamps.empty() && window.timestamps.front() < cutoff) {
        window.timestamps.pop_front();
    }
}

void SessionRateLimiter::Append(SessionWindow& window, Clock::time_point now) const {
    window.timestamps.push_back(now);
    while (window.timestamps.size() > maxMessages_) {
        window.timestamps.pop_front();
    }
}

} // namespace security
