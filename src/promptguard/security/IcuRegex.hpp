#pragma once

#include <unicode/regex.h>
#include <unicode/unistr.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace security {

// Compiles once; throws ConfigurationException naming the expression on failure.
// A compiled pattern can be shared between threads, each call below creates its
// own matcher.
std::unique_ptr<icu::RegexPattern> CompileRegex(const std::string& expression, uint32_t flags = 0);

// Matching never throws. An ICU runtime failure (e.g. backtrack stack
// exhaustion on hostile input) is logged and treated as "no match".
bool RegexSearch(const icu::RegexPattern& pattern, const icu::UnicodeString& text);
int32_t RegexCount(const icu::RegexPattern& pattern, const icu::UnicodeString& text);
std::vector<icu::UnicodeString> RegexFindAll(const icu::RegexPattern& pattern, const icu::UnicodeString& text);

// On a runtime failure the input is returned unchanged.
icu::UnicodeString RegexReplaceAll(const icu::RegexPattern& pattern, const icu::UnicodeString& text,
    const icu::UnicodeString& replacement);

} // namespace security
