#pragma once

#include <unicode/normalizer2.h>
#include <unicode/regex.h>
#include <unicode/unistr.h>

#include <memory>
#include <string>
#include <vector>

namespace security {

constexpr int kDefaultMaxInputLength = 2000;

class InputSanitizer {
public:
    explicit InputSanitizer(int maxLength = kDefaultMaxInputLength);
    ~InputSanitizer();

    // NFKC + zero-width removal, control character removal, whitespace
    // normalization, escape stripping, truncation to maxLength codepoints, trim.
    // The result never exceeds maxLength codepoints and is a fixed point:
    // Sanitize(Sanitize(x)) == Sanitize(x).
    std::string Sanitize(const std::string& text, bool preserveNewlines = true) const;

    // Sanitize without newlines, then at most two repeats of any character,
    // only word characters, whitespace and . , ! ? - kept, and punctuation
    // runs capped at two.
    std::string SanitizeStrict(const std::string& text) const;

    bool ValidateLength(const std::string& text) const;
    bool DetectSuspiciousEncoding(const std::string& text) const;
    std::string RemoveRepeatedCharacters(const std::string& text, int maxRepetition = 3) const;

    int GetMaxLength() const { return maxLength_; }

private:
    icu::UnicodeString RunPipeline(const icu::UnicodeString& text, bool preserveNewlines) const;

    icu::UnicodeString NormalizeUnicode(const icu::UnicodeString& text) const;
    icu::UnicodeString RemoveControlCharacters(const icu::UnicodeString& text, bool preserveNewlines) const;
    icu::UnicodeString NormalizeWhitespace(const icu::UnicodeString& text, bool preserveNewlines) const;
    icu::UnicodeString RemoveEscapeSequences(const icu::UnicodeString& text) const;
    icu::UnicodeString Truncate(const icu::UnicodeString& text) const;

    int maxLength_;
    const icu::Normalizer2* nfkc_;

    std::unique_ptr<icu::RegexPattern> horizontalSpacePattern_;
    std::unique_ptr<icu::RegexPattern> newlineRunPattern_;
    std::unique_ptr<icu::RegexPattern> whitespaceRunPattern_;
    std::vector<std::unique_ptr<icu::RegexPattern>> escapePatterns_;
    std::vector<std::unique_ptr<icu::RegexPattern>> encodingPatterns_;
    std::unique_ptr<icu::RegexPattern> disallowedStrictPattern_;
    std::unique_ptr<icu::RegexPattern> punctuationRunPattern_;
};

} // namespace security
