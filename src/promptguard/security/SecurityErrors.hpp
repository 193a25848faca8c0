#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace security {

enum class RejectionCategory {
    None,
    EmptyInput,
    Blacklisted,
    RateLimited,
    InjectionDetected,
};

inline const char* ToString(RejectionCategory category) {
    switch (category) {
    case RejectionCategory::None:
        return "none";
    case RejectionCategory::EmptyInput:
        return "empty-input";
    case RejectionCategory::Blacklisted:
        return "blacklist";
    case RejectionCategory::RateLimited:
        return "rate-limit";
    case RejectionCategory::InjectionDetected:
        return "injection-detected";
    }

    return "none";
}

class ConfigurationException : public std::runtime_error {
public:
    ConfigurationException(std::string setting, const std::string& message)
        : std::runtime_error("configuration error [" + setting + "] " + message)
        , setting_{std::move(setting)} {}

    const std::string& Setting() const { return setting_; }

private:
    std::string setting_;
};

// Raised towards the conversational layer when a message is rejected. what()
// is the rejection reason exactly as the moderator or detector produced it.
class ValidationException : public std::runtime_error {
public:
    ValidationException(RejectionCategory category, const std::string& reason)
        : std::runtime_error(reason)
        , category_{category} {}

    RejectionCategory Category() const { return category_; }

private:
    RejectionCategory category_;
};

} // namespace security
