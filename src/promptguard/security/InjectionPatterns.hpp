#pragma once

#include "security/ThreatLevel.hpp"

#include <unicode/regex.h>
#include <unicode/unistr.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace security {

struct InjectionPatternRule {
    std::string description;
    std::string expression;
    ThreatLevel level;
};

// The first kPriorityKeywordCount entries of SuspiciousKeywords() are the ones
// searched for inside decoded base64 payloads.
constexpr std::size_t kPriorityKeywordCount = 5;

const std::vector<InjectionPatternRule>& DefaultInjectionPatterns();
const std::vector<std::string>& SuspiciousKeywords();
const std::vector<std::string>& RolePlayIndicators();

struct PatternMatch {
    ThreatLevel level = ThreatLevel::Safe;
    std::vector<std::string> descriptions;
};

// Compiled, read-only pattern table. Every entry is compiled case-insensitive
// at construction; a malformed entry throws ConfigurationException.
class InjectionPatternRegistry {
public:
    explicit InjectionPatternRegistry(const std::vector<InjectionPatternRule>& rules);
    ~InjectionPatternRegistry();

    InjectionPatternRegistry(const InjectionPatternRegistry&) = delete;
    InjectionPatternRegistry& operator=(const InjectionPatternRegistry&) = delete;

    static const InjectionPatternRegistry& Default();

    // Searches text against every entry; collects all matches in table order.
    PatternMatch Match(const icu::UnicodeString& text) const;

    std::size_t Size() const { return entries_.size(); }

private:
    struct Entry {
        std::string description;
        ThreatLevel level;
        std::unique_ptr<icu::RegexPattern> regex;
    };

    std::vector<Entry> entries_;
};

} // namespace security
