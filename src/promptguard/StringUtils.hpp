#pragma once

#include <unicode/unistr.h>

#include <cstddef>
#include <string>
#include <vector>

icu::UnicodeString ToUnicode(const std::string& utf8);
std::string FromUnicode(const icu::UnicodeString& text);

std::string ToLowerUtf8(const std::string& text);
std::string TrimUtf8(const std::string& text);
icu::UnicodeString TrimWhitespace(const icu::UnicodeString& text);
bool IsBlank(const std::string& text);

std::size_t CodepointLength(const std::string& text);

// Returns at most maxCodepoints codepoints of text, for log output.
std::string ClipForLog(const std::string& text, std::size_t maxCodepoints = 50);

// Splits a raw "a; b, c" list into trimmed, non-empty entries.
std::vector<std::string> SplitPatternList(const std::string& raw);

std::string Join(const std::vector<std::string>& items, const std::string& separator = ", ");
