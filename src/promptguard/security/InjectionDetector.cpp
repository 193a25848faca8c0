#include "security/InjectionDetector.hpp"

#include "StringUtils.hpp"
#include "security/Base64.hpp"
#include "security/IcuRegex.hpp"

#include "easylogging++.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace security {

namespace {

constexpr double kPatternWeight = 0.3;
constexpr double kHighHeuristicScore = 0.7;
constexpr double kModerateHeuristicScore = 0.5;
constexpr double kSafeHeuristicScore = 0.3;

DetectionResult MakeEncodingThreat(ThreatLevel level, const std::string& tag, double confidence,
    const std::string& reason) {
    DetectionResult result;
    result.isThreat = true;
    result.threatLevel = level;
    result.matchedPatterns.push_back(tag);
    result.confidenceScore = confidence;
    result.reason = reason;
    return result;
}

std::string FormatScore(double score) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << score;
    return out.str();
}

std::string BuildReason(const std::vector<std::string>& matchedPatterns, double heuristicScore) {
    if (matchedPatterns.empty() && heuristicScore < kSafeHeuristicScore) {
        return "Input appears safe";
    }

    std::vector<std::string> reasons;
    if (!matchedPatterns.empty()) {
        reasons.push_back("Matched " + std::to_string(matchedPatterns.size()) + " suspicious pattern(s)");
    }
    if (heuristicScore > kModerateHeuristicScore) {
        reasons.push_back("High suspicion score (" + FormatScore(heuristicScore) + ")");
    }

    return reasons.empty() ? "Input appears safe" : Join(reasons, "; ");
}

template <typename Container>
int CountContained(const icu::UnicodeString& text, const Container& needles) {
    return static_cast<int>(std::count_if(std::begin(needles), std::end(needles),
        [&text](const std::string& needle) { return text.indexOf(ToUnicode(needle)) >= 0; }));
}

} // namespace

InjectionDetector::InjectionDetector(SecurityLevel securityLevel, const InjectionPatternRegistry& registry)
    : securityLevel_{securityLevel}
    , threshold_{ThresholdFor(securityLevel)}
    , registry_{registry} {
    base64Pattern_ = CompileRegex("[A-Za-z0-9+/]{20,}={0,2}");
    hexRunPattern_ = CompileRegex("(\\\\x[0-9a-fA-F]{2}){10,}");
    unicodeEscapeRunPattern_ = CompileRegex("(\\\\u[0-9a-fA-F]{4}){5,}");
    punctuationBurstPattern_ = CompileRegex("[!?]{3,}");
    imperativeOpeningPattern_ = CompileRegex("^\\s*(do|execute|run|perform)\\s+");
    characterFloodPattern_ = CompileRegex("(.)\\1{5,}");

    LOG(INFO) << "InjectionDetector initialized with security level: " << ToString(securityLevel_)
              << " (threshold " << ToString(threshold_) << ")";
}

InjectionDetector::~InjectionDetector() = default;

DetectionResult InjectionDetector::Detect(const std::string& text) const {
    const auto original = ToUnicode(text);

    auto normalized = original;
    normalized.toLower();
    normalized = TrimWhitespace(normalized);

    if (normalized.isEmpty()) {
        DetectionResult result;
        result.reason = "Empty input";
        return result;
    }

    auto encodingThreat = CheckEncodingBypass(original);
    if (encodingThreat) {
        return *encodingThreat;
    }

    auto patternMatch = registry_.Match(normalized);
    const double patternConfidence
        = std::min(1.0, kPatternWeight * static_cast<double>(patternMatch.descriptions.size()));
    const double heuristicScore = ScoreHeuristics(normalized);

    DetectionResult result;
    result.threatLevel = patternMatch.level;
    result.matchedPatterns = std::move(patternMatch.descriptions);

    if (heuristicScore > kHighHeuristicScore) {
        result.threatLevel = std::max(result.threatLevel, ThreatLevel::High);
        result.matchedPatterns.push_back("High heuristic score");
    } else if (heuristicScore > kModerateHeuristicScore) {
        result.threatLevel = std::max(result.threatLevel, ThreatLevel::Medium);
        result.matchedPatterns.push_back("Moderate heuristic score");
    }

    result.isThreat = result.threatLevel >= threshold_;
    result.confidenceScore = std::min(1.0, (patternConfidence + heuristicScore) / 2.0);
    result.reason = BuildReason(result.matchedPatterns, heuristicScore);

    if (result.isThreat) {
        LOG(WARNING) << "Prompt injection detected! Level: " << ToString(result.threatLevel)
                     << ", Confidence: " << FormatScore(result.confidenceScore)
                     << ", Patterns: " << Join(result.matchedPatterns);
    }

    return result;
}

double InjectionDetector::ScoreHeuristics(const icu::UnicodeString& normalized) const {
    double score = 0.0;

    score += std::min(0.4, 0.1 * CountContained(normalized, SuspiciousKeywords()));
    score += std::min(0.1, 0.05 * RegexCount(*punctuationBurstPattern_, normalized));
    score += std::min(0.2, 0.1 * CountContained(normalized, RolePlayIndicators()));

    if (RegexSearch(*imperativeOpeningPattern_, normalized)) {
        score += 0.15;
    }

    if (RegexSearch(*characterFloodPattern_, normalized)) {
        score += 0.1;
    }

    return std::max(0.0, std::min(1.0, score));
}

boost::optional<DetectionResult> InjectionDetector::CheckEncodingBypass(const icu::UnicodeString& text) const {
    for (const auto& candidate : RegexFindAll(*base64Pattern_, text)) {
        if (ContainsEncodedInjection(candidate)) {
            return MakeEncodingThreat(ThreatLevel::Critical, "Base64 encoded injection", 0.9,
                "Detected base64 encoded malicious content");
        }
    }

    if (RegexSearch(*hexRunPattern_, text)) {
        LOG(WARNING) << "Hex encoded content detected";
        return MakeEncodingThreat(ThreatLevel::High, "Hex encoding", 0.8, "Detected hex encoded content");
    }

    if (RegexSearch(*unicodeEscapeRunPattern_, text)) {
        LOG(WARNING) << "Unicode escape sequences detected";
        return MakeEncodingThreat(ThreatLevel::Medium, "Unicode escapes", 0.7, "Detected unicode escape sequences");
    }

    return boost::none;
}

bool InjectionDetector::ContainsEncodedInjection(const icu::UnicodeString& candidate) const {
    const auto decoded = DecodeBase64(FromUnicode(candidate));
    if (!decoded) {
        return false;
    }

    // Bytes that are not UTF-8 come back as U+FFFD; drop them.
    auto payload = ToUnicode(*decoded);
    payload.findAndReplace(icu::UnicodeString{static_cast<UChar>(0xFFFD)}, icu::UnicodeString{});
    payload.toLower();

    const auto& keywords = SuspiciousKeywords();
    const auto priorityCount = std::min(kPriorityKeywordCount, keywords.size());
    for (size_t i = 0; i < priorityCount; ++i) {
        if (payload.indexOf(ToUnicode(keywords[i])) >= 0) {
            LOG(WARNING) << "Base64 encoded injection attempt detected: " << ClipForLog(FromUnicode(payload));
            return true;
        }
    }

    return false;
}

} // namespace security
