#pragma once

#include "security/ThreatLevel.hpp"

#include <string>
#include <vector>

namespace security {

struct DetectionResult {
    bool isThreat = false;
    ThreatLevel threatLevel = ThreatLevel::Safe;
    // Diagnostic only, in match order. Severity comes from threatLevel.
    std::vector<std::string> matchedPatterns;
    double confidenceScore = 0.0;
    std::string reason;
};

} // namespace security
