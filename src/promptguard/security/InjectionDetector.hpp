#pragma once

#include "security/DetectionResult.hpp"
#include "security/InjectionPatterns.hpp"
#include "security/ThreatLevel.hpp"

#include <boost/optional.hpp>

#include <unicode/regex.h>
#include <unicode/unistr.h>

#include <memory>
#include <string>

namespace security {

class InjectionDetector {
public:
    // The detector keeps a reference to registry, which must outlive it.
    explicit InjectionDetector(SecurityLevel securityLevel = SecurityLevel::Medium,
        const InjectionPatternRegistry& registry = InjectionPatternRegistry::Default());
    ~InjectionDetector();

    DetectionResult Detect(const std::string& text) const;

    // Suspicion score in [0, 1] for already lower-cased, trimmed text.
    double ScoreHeuristics(const icu::UnicodeString& normalized) const;

    SecurityLevel GetSecurityLevel() const { return securityLevel_; }
    ThreatLevel GetThreshold() const { return threshold_; }

private:
    boost::optional<DetectionResult> CheckEncodingBypass(const icu::UnicodeString& text) const;
    bool ContainsEncodedInjection(const icu::UnicodeString& candidate) const;

    SecurityLevel securityLevel_;
    ThreatLevel threshold_;
    const InjectionPatternRegistry& registry_;

    std::unique_ptr<icu::RegexPattern> base64Pattern_;
    std::unique_ptr<icu::RegexPattern> hexRunPattern_;
    std::unique_ptr<icu::RegexPattern> unicodeEscapeRunPattern_;
    std::unique_ptr<icu::RegexPattern> punctuationBurstPattern_;
    std::unique_ptr<icu::RegexPattern> imperativeOpeningPattern_;
    std::unique_ptr<icu::RegexPattern> characterFloodPattern_;
};

} // namespace security
