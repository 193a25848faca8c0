#include "security/ThreatLevel.hpp"

#include "security/SecurityErrors.hpp"

#include <algorithm>
#include <cctype>

namespace security {

SecurityLevel ParseSecurityLevel(const std::string& value) {
    std::string upper = value;
    std::transform(std::begin(upper), std::end(upper), std::begin(upper),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "LOW") {
        return SecurityLevel::Low;
    }
    if (upper == "MEDIUM") {
        return SecurityLevel::Medium;
    }
    if (upper == "HIGH") {
        return SecurityLevel::High;
    }

    throw ConfigurationException("security_level",
        "unsupported value '" + value + "'; expected LOW, MEDIUM or HIGH");
}

ThreatLevel ThresholdFor(SecurityLevel level) {
    switch (level) {
    case SecurityLevel::Low:
        return ThreatLevel::High;
    case SecurityLevel::Medium:
        return ThreatLevel::Medium;
    case SecurityLevel::High:
        return ThreatLevel::Low;
    }

    return ThreatLevel::Medium;
}

} // namespace security
