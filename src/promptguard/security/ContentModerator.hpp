#pragma once

#include "security/ModerationResult.hpp"
#include "security/SessionRateLimiter.hpp"

#include <boost/optional.hpp>

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace security {

class InjectionDetector;
class InputSanitizer;

constexpr char kDefaultSessionId[] = "default";

struct ModeratorOptions {
    int rateLimitMessages = 10;
    std::chrono::seconds rateLimitWindow{60};
    bool enableRateLimiting = true;
    bool enableContentModeration = true;
    bool enableInjectionDetection = true;
    bool strictSanitization = false;
    std::vector<std::string> blacklistPatterns;
    std::vector<std::string> whitelistPatterns;
};

class ContentModerator {
public:
    ContentModerator(const InputSanitizer* sanitizer, const InjectionDetector* detector, ModeratorOptions options,
        SessionRateLimiter::ClockSource clock = nullptr);
    ~ContentModerator();

    // Empty check, whitelist, blacklist, then the session rate limit. An
    // allowed message is counted against the session's window.
    ModerationResult Moderate(const std::string& text, const std::string& sessionId = kDefaultSessionId);

    // Moderate, then sanitize, then detect. Never throws for hostile input.
    EvaluationResult Evaluate(const std::string& text, const std::string& sessionId = kDefaultSessionId);

    // Evaluate for callers that treat rejection as failure: returns the
    // sanitized text or throws ValidationException.
    std::string Validate(const std::string& text, const std::string& sessionId = kDefaultSessionId);

    // Patterns are stored lower-case; returns false for duplicates and blanks.
    bool AddBlacklistPattern(const std::string& pattern);
    bool AddWhitelistPattern(const std::string& pattern);

    void ResetSession(const std::string& sessionId);
    SessionStats GetSessionStats(const std::string& sessionId) const;
    std::size_t PurgeIdleSessions(std::chrono::seconds idle);

    const ModeratorOptions& GetOptions() const { return options_; }

private:
    bool AddPattern(std::vector<std::string>& patterns, const std::string& pattern, const char* listName);
    bool MatchesWhitelist(const std::string& loweredText) const;
    boost::optional<std::string> FindBlacklistMatch(const std::string& loweredText) const;

    const InputSanitizer* sanitizer_;
    const InjectionDetector* detector_;
    ModeratorOptions options_;
    SessionRateLimiter rateLimiter_;

    mutable std::mutex patternsMutex_;
    std::vector<std::string> blacklist_;
    std::vector<std::string> whitelist_;
};

} // namespace security
