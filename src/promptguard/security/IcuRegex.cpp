#include "security/IcuRegex.hpp"

#include "StringUtils.hpp"
#include "security/SecurityErrors.hpp"

#include "easylogging++.h"

#include <unicode/utypes.h>

namespace security {

namespace {

std::unique_ptr<icu::RegexMatcher> MakeMatcher(const icu::RegexPattern& pattern, const icu::UnicodeString& text) {
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher{pattern.matcher(text, status)};
    if (U_FAILURE(status)) {
        LOG(WARNING) << "Unable to create regex matcher for " << FromUnicode(pattern.pattern()) << ": "
                     << u_errorName(status);
        return nullptr;
    }

    return matcher;
}

void LogMatchFailure(const icu::RegexPattern& pattern, UErrorCode status) {
    LOG(WARNING) << "Regex evaluation failed for " << FromUnicode(pattern.pattern()) << ": " << u_errorName(status);
}

} // namespace

std::unique_ptr<icu::RegexPattern> CompileRegex(const std::string& expression, uint32_t flags) {
    UErrorCode status = U_ZERO_ERROR;
    UParseError parseError;
    std::unique_ptr<icu::RegexPattern> pattern{
        icu::RegexPattern::compile(ToUnicode(expression), flags, parseError, status)};

    if (U_FAILURE(status)) {
        throw ConfigurationException("pattern",
            "cannot compile '" + expression + "' at offset " + std::to_string(parseError.offset) + ": "
                + u_errorName(status));
    }

    return pattern;
}

bool RegexSearch(const icu::RegexPattern& pattern, const icu::UnicodeString& text) {
    auto matcher = MakeMatcher(pattern, text);
    if (!matcher) {
        return false;
    }

    UErrorCode status = U_ZERO_ERROR;
    const bool found = matcher->find(status);
    if (U_FAILURE(status)) {
        LogMatchFailure(pattern, status);
        return false;
    }

    return found;
}

int32_t RegexCount(const icu::RegexPattern& pattern, const icu::UnicodeString& text) {
    return static_cast<int32_t>(RegexFindAll(pattern, text).size());
}

std::vector<icu::UnicodeString> RegexFindAll(const icu::RegexPattern& pattern, const icu::UnicodeString& text) {
    std::vector<icu::UnicodeString> matches;

    auto matcher = MakeMatcher(pattern, text);
    if (!matcher) {
        return matches;
    }

    UErrorCode status = U_ZERO_ERROR;
    while (matcher->find(status) && U_SUCCESS(status)) {
        matches.push_back(matcher->group(status));
        if (U_FAILURE(status)) {
            break;
        }
    }

    if (U_FAILURE(status)) {
        LogMatchFailure(pattern, status);
    }

    return matches;
}

icu::UnicodeString RegexReplaceAll(const icu::RegexPattern& pattern, const icu::UnicodeString& text,
    const icu::UnicodeString& replacement) {
    auto matcher = MakeMatcher(pattern, text);
    if (!matcher) {
        return text;
    }

    UErrorCode status = U_ZERO_ERROR;
    auto replaced = matcher->replaceAll(replacement, status);
    if (U_FAILURE(status)) {
        LogMatchFailure(pattern, status);
        return text;
    }

    return replaced;
}

} // namespace security
