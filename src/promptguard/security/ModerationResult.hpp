#pragma once

#include "security/DetectionResult.hpp"
#include "security/SecurityErrors.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace security {

enum class ModerationAction {
    None,
    Blocked,
    RateLimited,
};

inline const char* ToString(ModerationAction action) {
    switch (action) {
    case ModerationAction::None:
        return "none";
    case ModerationAction::Blocked:
        return "blocked";
    case ModerationAction::RateLimited:
        return "rate_limited";
    }

    return "none";
}

struct ModerationResult {
    bool isAllowed = false;
    std::string reason;
    ModerationAction actionTaken = ModerationAction::None;
};

struct SessionStats {
    std::string sessionId;
    std::size_t messagesInWindow = 0;
    std::size_t limit = 0;
    std::chrono::seconds window{0};
    std::size_t remaining = 0;
};

// Outcome of the full moderation -> sanitization -> detection pipeline.
struct EvaluationResult {
    bool accepted = false;
    std::string text;
    RejectionCategory category = RejectionCategory::None;
    std::string reason;
    DetectionResult detection;
};

} // namespace security
