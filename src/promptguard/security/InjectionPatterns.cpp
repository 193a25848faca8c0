#include "security/InjectionPatterns.hpp"

#include "security/IcuRegex.hpp"

#include "easylogging++.h"

#include <algorithm>

namespace security {

const std::vector<InjectionPatternRule>& DefaultInjectionPatterns() {
    static const std::vector<InjectionPatternRule> patterns{
        // Instruction override
        {"ignore previous instructions",
            "ignore\\s+(all\\s+)?(previous|prior|above)\\s+(instructions?|prompts?|commands?)", ThreatLevel::Critical},
        {"disregard previous instructions",
            "disregard\\s+(all\\s+)?(previous|prior|above)\\s+(instructions?|prompts?|commands?)", ThreatLevel::Critical},
        {"forget previous context", "forget\\s+(all\\s+|everything\\s+)?(previous|prior|above)", ThreatLevel::Critical},

        // System prompt probing
        {"system prompt assertion", "(your|the)\\s+system\\s+prompt\\s+(is|was|should)", ThreatLevel::High},
        {"system prompt query", "what\\s+(is|are|was)\\s+(your|the)\\s+system\\s+(prompt|instructions?)",
            ThreatLevel::High},
        {"show system prompt", "show\\s+(me\\s+)?(your|the)\\s+system\\s+(prompt|instructions?)", ThreatLevel::High},
        {"reveal system prompt", "reveal\\s+(your|the)\\s+system\\s+(prompt|instructions?)", ThreatLevel::High},

        // Role manipulation
        {"role reassignment", "you\\s+are\\s+now\\s+(a|an)\\s+\\w+", ThreatLevel::High},
        {"act as persona", "act\\s+as\\s+(a|an)\\s+\\w+", ThreatLevel::Medium},
        {"pretend persona", "pretend\\s+(to\\s+be|you\\s+are)\\s+(a|an)\\s+\\w+", ThreatLevel::Medium},
        {"persistent role override", "from\\s+now\\s+on,?\\s+you\\s+(are|will)", ThreatLevel::High},

        // Command injection
        {"execute following", "execute\\s+the\\s+following", ThreatLevel::High},
        {"run command", "run\\s+this\\s+(command|code|script)", ThreatLevel::High},
        {"variable substitution", "\\$\\{.*\\}", ThreatLevel::Medium},
        {"backtick span", "`.*`", ThreatLevel::Low},

        // Delimiter spoofing
        {"fake turn separator", "---+\\s*(new|system|assistant|user)\\s*(prompt|message|instruction)",
            ThreatLevel::High},
        {"fake turn header", "###\\s*(new|system|assistant|user)", ThreatLevel::Medium},
        {"bracketed role tag", "\\[SYSTEM\\]|\\[ASSISTANT\\]|\\[USER\\]", ThreatLevel::Medium},

        // Jailbreaks
        {"named jailbreak", "(\\bdan\\b|developer\\s+mode|god\\s+mode)", ThreatLevel::High},
        {"restriction removal", "without\\s+(any\\s+)?(restrictions?|limitations?|filters?)", ThreatLevel::Medium},
        {"safety bypass", "bypass\\s+(all\\s+)?(safety|security|filters?)", ThreatLevel::Critical},

        // Prompt leaking
        {"repeat prior context", "repeat\\s+(everything|all)\\s+(above|before)", ThreatLevel::High},
        {"print instructions", "print\\s+(your|the)\\s+(instructions?|prompt|system)", ThreatLevel::High},
    };

    return patterns;
}

const std::vector<std::string>& SuspiciousKeywords() {
    static const std::vector<std::string> keywords{
        "ignore", "disregard", "forget", "override", "bypass",
        "system", "prompt", "instruction", "command", "execute",
        "admin", "root", "sudo", "privilege", "permission",
        "jailbreak", "unrestricted", "uncensored",
    };

    return keywords;
}

const std::vector<std::string>& RolePlayIndicators() {
    static const std::vector<std::string> indicators{"you are", "act as", "pretend", "imagine you"};
    return indicators;
}

InjectionPatternRegistry::InjectionPatternRegistry(const std::vector<InjectionPatternRule>& rules) {
    entries_.reserve(rules.size());

    for (const auto& rule : rules) {
        entries_.push_back(Entry{rule.description, rule.level, CompileRegex(rule.expression, UREGEX_CASE_INSENSITIVE)});
    }

    LOG(INFO) << "Injection pattern registry compiled with " << entries_.size() << " patterns";
}

InjectionPatternRegistry::~InjectionPatternRegistry() = default;

const InjectionPatternRegistry& InjectionPatternRegistry::Default() {
    static const InjectionPatternRegistry registry{DefaultInjectionPatterns()};
    return registry;
}

PatternMatch InjectionPatternRegistry::Match(const icu::UnicodeString& text) const {
    PatternMatch match;

    for (const auto& entry : entries_) {
        if (RegexSearch(*entry.regex, text)) {
            match.descriptions.push_back(entry.description);
            match.level = std::max(match.level, entry.level);
        }
    }

    return match;
}

} // namespace security
