#pragma once

#include <string>

namespace security {

// Declaration order is the severity order; compare with the built-in operators.
enum class ThreatLevel {
    Safe = 0,
    Low = 1,
    Medium = 2,
    High = 3,
    Critical = 4,
};

enum class SecurityLevel {
    Low,
    Medium,
    High,
};

inline const char* ToString(ThreatLevel level) {
    switch (level) {
    case ThreatLevel::Safe:
        return "SAFE";
    case ThreatLevel::Low:
        return "LOW";
    case ThreatLevel::Medium:
        return "MEDIUM";
    case ThreatLevel::High:
        return "HIGH";
    case ThreatLevel::Critical:
        return "CRITICAL";
    }

    return "SAFE";
}

inline const char* ToString(SecurityLevel level) {
    switch (level) {
    case SecurityLevel::Low:
        return "LOW";
    case SecurityLevel::Medium:
        return "MEDIUM";
    case SecurityLevel::High:
        return "HIGH";
    }

    return "MEDIUM";
}

// Accepts LOW, MEDIUM or HIGH in any case; throws ConfigurationException otherwise.
SecurityLevel ParseSecurityLevel(const std::string& value);

// A stricter security level blocks at a lower threat level:
// LOW -> HIGH, MEDIUM -> MEDIUM, HIGH -> LOW.
ThreatLevel ThresholdFor(SecurityLevel level);

} // namespace security
