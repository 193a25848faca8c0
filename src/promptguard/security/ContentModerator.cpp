#include "security/ContentModerator.hpp"

#include "StringUtils.hpp"
#include "security/InjectionDetector.hpp"
#include "security/InputSanitizer.hpp"
#include "security/SecurityErrors.hpp"

#include "easylogging++.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace security {

namespace {

ModeratorOptions ValidateOptions(ModeratorOptions options) {
    if (options.rateLimitMessages <= 0) {
        throw ConfigurationException("rate_limit_messages",
            "must be a positive integer, got: " + std::to_string(options.rateLimitMessages));
    }

    if (options.rateLimitWindow.count() <= 0) {
        throw ConfigurationException("rate_limit_window",
            "must be a positive number of seconds, got: " + std::to_string(options.rateLimitWindow.count()));
    }

    return options;
}

ModerationResult Allow(const std::string& reason) {
    ModerationResult result;
    result.isAllowed = true;
    result.reason = reason;
    return result;
}

ModerationResult Reject(const std::string& reason, ModerationAction action) {
    ModerationResult result;
    result.reason = reason;
    result.actionTaken = action;
    return result;
}

RejectionCategory CategoryFor(ModerationAction action) {
    switch (action) {
    case ModerationAction::Blocked:
        return RejectionCategory::Blacklisted;
    case ModerationAction::RateLimited:
        return RejectionCategory::RateLimited;
    case ModerationAction::None:
        return RejectionCategory::EmptyInput;
    }

    return RejectionCategory::EmptyInput;
}

EvaluationResult Rejected(RejectionCategory category, const std::string& reason) {
    EvaluationResult result;
    result.category = category;
    result.reason = reason;
    return result;
}

} // namespace

ContentModerator::ContentModerator(const InputSanitizer* sanitizer, const InjectionDetector* detector,
    ModeratorOptions options, SessionRateLimiter::ClockSource clock)
    : sanitizer_{sanitizer}
    , detector_{detector}
    , options_{ValidateOptions(std::move(options))}
    , rateLimiter_{static_cast<std::size_t>(options_.rateLimitMessages), options_.rateLimitWindow, std::move(clock)} {
    if (sanitizer_ == nullptr || detector_ == nullptr) {
        throw std::invalid_argument("ContentModerator requires a sanitizer and a detector");
    }

    for (const auto& pattern : options_.blacklistPatterns) {
        AddBlacklistPattern(pattern);
    }

    for (const auto& pattern : options_.whitelistPatterns) {
        AddWhitelistPattern(pattern);
    }

    LOG(INFO) << "ContentModerator initialized: rate_limit=" << options_.rateLimitMessages << "/"
              << options_.rateLimitWindow.count() << "s, enabled=" << std::boolalpha << options_.enableRateLimiting
              << ", moderation=" << options_.enableContentModeration
              << ", injection_detection=" << options_.enableInjectionDetection
              << ", strict=" << options_.strictSanitization;
}

ContentModerator::~ContentModerator() = default;

ModerationResult ContentModerator::Moderate(const std::string& text, const std::string& sessionId) {
    if (IsBlank(text)) {
        return Reject("Empty message", ModerationAction::None);
    }

    const auto loweredText = ToLowerUtf8(text);

    if (MatchesWhitelist(loweredText)) {
        return Allow("Whitelisted content");
    }

    auto blacklistMatch = FindBlacklistMatch(loweredText);
    if (blacklistMatch) {
        LOG(WARNING) << "Blacklisted content detected: " << *blacklistMatch;
        return Reject("Content contains blacklisted pattern", ModerationAction::Blocked);
    }

    if (!options_.enableRateLimiting) {
        rateLimiter_.Record(sessionId);
        return Allow("Content approved");
    }

    const auto admission = rateLimiter_.TryAcquire(sessionId);
    if (!admission.admitted) {
        LOG(WARNING) << "Rate limit exceeded for session " << sessionId << ": " << admission.messagesInWindow
                     << " messages in " << options_.rateLimitWindow.count() << "s";
        return Reject("Rate limit exceeded. Please wait " + std::to_string(admission.retryAfter.count()) + " seconds.",
            ModerationAction::RateLimited);
    }

    return Allow("Content approved");
}

EvaluationResult ContentModerator::Evaluate(const std::string& text, const std::string& sessionId) {
    if (IsBlank(text)) {
        return Rejected(RejectionCategory::EmptyInput, "Empty message");
    }

    if (options_.enableContentModeration) {
        const auto moderation = Moderate(text, sessionId);
        if (!moderation.isAllowed) {
            return Rejected(CategoryFor(moderation.actionTaken), moderation.reason);
        }
    }

    auto sanitized = options_.strictSanitization ? sanitizer_->SanitizeStrict(text) : sanitizer_->Sanitize(text);
    if (sanitized.empty()) {
        return Rejected(RejectionCategory::EmptyInput, "Empty message after sanitization");
    }

    EvaluationResult result;
    if (options_.enableInjectionDetection) {
        result.detection = detector_->Detect(sanitized);
        if (result.detection.isThreat) {
            LOG(WARNING) << "Rejected message for session " << sessionId << ": " << result.detection.reason;
            result.category = RejectionCategory::InjectionDetected;
            result.reason = result.detection.reason;
            return result;
        }
    }

    result.accepted = true;
    result.text = std::move(sanitized);
    result.reason = "Content approved";
    return result;
}

std::string ContentModerator::Validate(const std::string& text, const std::string& sessionId) {
    auto result = Evaluate(text, sessionId);
    if (!result.accepted) {
        throw ValidationException(result.category, result.reason);
    }

    return std::move(result.text);
}

bool ContentModerator::AddBlacklistPattern(const std::string& pattern) {
    return AddPattern(blacklist_, pattern, "blacklist");
}

bool ContentModerator::AddWhitelistPattern(const std::string& pattern) {
    return AddPattern(whitelist_, pattern, "whitelist");
}

void ContentModerator::ResetSession(const std::string& sessionId) {
    if (rateLimiter_.Reset(sessionId)) {
        LOG(INFO) << "Reset rate limiting for session: " << sessionId;
    }
}

SessionStats ContentModerator::GetSessionStats(const std::string& sessionId) const {
    return rateLimiter_.GetStats(sessionId);
}

std::size_t ContentModerator::PurgeIdleSessions(std::chrono::seconds idle) {
    const auto removed = rateLimiter_.PurgeIdle(idle);
    if (removed > 0) {
        LOG(INFO) << "Purged " << removed << " idle session(s)";
    }
    return removed;
}

bool ContentModerator::AddPattern(std::vector<std::string>& patterns, const std::string& pattern,
    const char* listName) {
    if (IsBlank(pattern)) {
        LOG(WARNING) << "Ignoring blank " << listName << " pattern";
        return false;
    }

    auto lowered = ToLowerUtf8(pattern);

    std::lock_guard<std::mutex> lock{patternsMutex_};
    if (std::find(std::begin(patterns), std::end(patterns), lowered) != std::end(patterns)) {
        return false;
    }

    patterns.push_back(std::move(lowered));
    LOG(INFO) << "Added " << listName << " pattern: " << pattern;
    return true;
}

bool ContentModerator::MatchesWhitelist(const std::string& loweredText) const {
    std::lock_guard<std::mutex> lock{patternsMutex_};
    return std::any_of(std::begin(whitelist_), std::end(whitelist_),
        [&loweredText](const std::string& pattern) { return loweredText.find(pattern) != std::string::npos; });
}

boost::optional<std::string> ContentModerator::FindBlacklistMatch(const std::string& loweredText) const {
    std::lock_guard<std::mutex> lock{patternsMutex_};

    for (const auto& pattern : blacklist_) {
        if (loweredText.find(pattern) != std::string::npos) {
            return pattern;
        }
    }

    return boost::none;
}

} // namespace security
