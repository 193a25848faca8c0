#include "security/InputSanitizer.hpp"

#include "StringUtils.hpp"
#include "security/IcuRegex.hpp"
#include "security/SecurityErrors.hpp"

#include "easylogging++.h"

#include <unicode/uchar.h>

#include <stdexcept>

namespace security {

namespace {

const char* const kEscapeExpressions[] = {
    "\\x1b\\[[0-9;]*[a-zA-Z]",   // ANSI terminal escape
    "\\\\[xX][0-9a-fA-F]{2}",    // \xHH
    "\\\\[uU][0-9a-fA-F]{4}",    // \uHHHH
    "\\\\[0-7]{1,3}",            // \NNN
};

const char* const kEncodingExpressions[] = {
    "\\\\x[0-9a-fA-F]{2}",
    "\\\\u[0-9a-fA-F]{4}",
    "%[0-9a-fA-F]{2}",
    "&#\\d+;",
    "&[a-zA-Z]+;",
};

bool IsZeroWidth(UChar32 c) {
    return c == 0x200B || c == 0x200C || c == 0x200D || c == 0xFEFF;
}

bool IsOtherCategory(UChar32 c) {
    return (U_GET_GC_MASK(c) & U_GC_C_MASK) != 0;
}

bool IsLineControl(UChar32 c) {
    return c == '\n' || c == '\r' || c == '\t';
}

} // namespace

InputSanitizer::InputSanitizer(int maxLength)
    : maxLength_{maxLength}
    , nfkc_{nullptr} {
    if (maxLength_ <= 0) {
        throw ConfigurationException("max_input_length",
            "must be a positive integer, got: " + std::to_string(maxLength_));
    }

    UErrorCode status = U_ZERO_ERROR;
    nfkc_ = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status)) {
        throw ConfigurationException("unicode", std::string{"NFKC normalizer unavailable: "} + u_errorName(status));
    }

    horizontalSpacePattern_ = CompileRegex("[ \\t]+");
    newlineRunPattern_ = CompileRegex("\\n{3,}");
    whitespaceRunPattern_ = CompileRegex("\\s+");

    for (auto expression : kEscapeExpressions) {
        escapePatterns_.push_back(CompileRegex(expression));
    }

    for (auto expression : kEncodingExpressions) {
        encodingPatterns_.push_back(CompileRegex(expression));
    }

    disallowedStrictPattern_ = CompileRegex("[^\\w\\s.,!?\\-]");
    punctuationRunPattern_ = CompileRegex("([.,!?\\-]){3,}");

    LOG(INFO) << "InputSanitizer initialized with max_length: " << maxLength_;
}

InputSanitizer::~InputSanitizer() = default;

std::string InputSanitizer::Sanitize(const std::string& text, bool preserveNewlines) const {
    if (text.empty()) {
        return "";
    }

    const auto original = ToUnicode(text);

    // Stripping an escape can splice its neighbours into a new escape or a
    // new whitespace run, so repeat the pipeline until nothing changes.
    auto current = RunPipeline(original, preserveNewlines);
    for (;;) {
        auto next = RunPipeline(current, preserveNewlines);
        if (next == current) {
            break;
        }
        current = std::move(next);
    }

    const auto originalLength = original.countChar32();
    const auto sanitizedLength = current.countChar32();
    if (sanitizedLength != originalLength) {
        LOG(DEBUG) << "Input sanitized: " << originalLength << " -> " << sanitizedLength << " characters";
    }

    return FromUnicode(current);
}

std::string InputSanitizer::SanitizeStrict(const std::string& text) const {
    auto sanitized = ToUnicode(RemoveRepeatedCharacters(Sanitize(text, false), 2));

    sanitized = RegexReplaceAll(*disallowedStrictPattern_, sanitized, icu::UnicodeString{});
    sanitized = RegexReplaceAll(*punctuationRunPattern_, sanitized, icu::UnicodeString::fromUTF8("$1$1"));

    return FromUnicode(sanitized);
}

bool InputSanitizer::ValidateLength(const std::string& text) const {
    return CodepointLength(text) <= static_cast<std::size_t>(maxLength_);
}

bool InputSanitizer::DetectSuspiciousEncoding(const std::string& text) const {
    const auto unicode = ToUnicode(text);

    for (const auto& pattern : encodingPatterns_) {
        if (RegexSearch(*pattern, unicode)) {
            LOG(WARNING) << "Suspicious encoding pattern detected: " << FromUnicode(pattern->pattern());
            return true;
        }
    }

    return false;
}

std::string InputSanitizer::RemoveRepeatedCharacters(const std::string& text, int maxRepetition) const {
    if (maxRepetition < 1) {
        throw std::invalid_argument("maxRepetition must be at least 1");
    }

    const auto unicode = ToUnicode(text);
    icu::UnicodeString result;

    UChar32 previous = U_SENTINEL;
    int run = 0;
    for (int32_t i = 0; i < unicode.length(); i = unicode.moveIndex32(i, 1)) {
        const UChar32 c = unicode.char32At(i);

        // Line breaks are never treated as a repeated character.
        if (c == previous && c != '\n') {
            ++run;
        } else {
            previous = c;
            run = 1;
        }

        if (run <= maxRepetition) {
            result.append(c);
        }
    }

    return FromUnicode(result);
}

icu::UnicodeString InputSanitizer::RunPipeline(const icu::UnicodeString& text, bool preserveNewlines) const {
    auto result = NormalizeUnicode(text);
    result = RemoveControlCharacters(result, preserveNewlines);
    result = NormalizeWhitespace(result, preserveNewlines);
    result = RemoveEscapeSequences(result);
    result = Truncate(result);
    return TrimWhitespace(result);
}

icu::UnicodeString InputSanitizer::NormalizeUnicode(const icu::UnicodeString& text) const {
    UErrorCode status = U_ZERO_ERROR;
    auto normalized = nfkc_->normalize(text, status);
    if (U_FAILURE(status)) {
        LOG(WARNING) << "NFKC normalization failed: " << u_errorName(status);
        normalized = text;
    }

    icu::UnicodeString result;
    for (int32_t i = 0; i < normalized.length(); i = normalized.moveIndex32(i, 1)) {
        const UChar32 c = normalized.char32At(i);
        if (!IsZeroWidth(c)) {
            result.append(c);
        }
    }

    return result;
}

icu::UnicodeString InputSanitizer::RemoveControlCharacters(const icu::UnicodeString& text, bool preserveNewlines) const {
    icu::UnicodeString result;

    for (int32_t i = 0; i < text.length(); i = text.moveIndex32(i, 1)) {
        const UChar32 c = text.char32At(i);
        if ((preserveNewlines && IsLineControl(c)) || !IsOtherCategory(c)) {
            result.append(c);
        }
    }

    return result;
}

icu::UnicodeString InputSanitizer::NormalizeWhitespace(const icu::UnicodeString& text, bool preserveNewlines) const {
    const icu::UnicodeString space{static_cast<UChar>(' ')};

    if (!preserveNewlines) {
        return RegexReplaceAll(*whitespaceRunPattern_, text, space);
    }

    auto result = RegexReplaceAll(*horizontalSpacePattern_, text, space);
    return RegexReplaceAll(*newlineRunPattern_, result, icu::UnicodeString::fromUTF8("\n\n"));
}

icu::UnicodeString InputSanitizer::RemoveEscapeSequences(const icu::UnicodeString& text) const {
    auto result = text;
    for (const auto& pattern : escapePatterns_) {
        result = RegexReplaceAll(*pattern, result, icu::UnicodeString{});
    }
    return result;
}

icu::UnicodeString InputSanitizer::Truncate(const icu::UnicodeString& text) const {
    const auto length = text.countChar32();
    if (length <= maxLength_) {
        return text;
    }

    LOG(WARNING) << "Input truncated from " << length << " to " << maxLength_ << " characters";

    auto result = text;
    result.truncate(result.moveIndex32(0, maxLength_));
    return result;
}

} // namespace security
