#include "StringUtils.hpp"

#include <unicode/uchar.h>

#include <sstream>

icu::UnicodeString ToUnicode(const std::string& utf8) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
}

std::string FromUnicode(const icu::UnicodeString& text) {
    std::string out;
    text.toUTF8String(out);
    return out;
}

std::string ToLowerUtf8(const std::string& text) {
    auto unicode = ToUnicode(text);
    unicode.toLower();
    return FromUnicode(unicode);
}

icu::UnicodeString TrimWhitespace(const icu::UnicodeString& text) {
    int32_t start = 0;
    int32_t end = text.length();

    while (start < end && u_isUWhiteSpace(text.char32At(start))) {
        start = text.moveIndex32(start, 1);
    }

    while (end > start) {
        const int32_t previous = text.moveIndex32(end, -1);
        if (!u_isUWhiteSpace(text.char32At(previous))) {
            break;
        }
        end = previous;
    }

    return icu::UnicodeString{text, start, end - start};
}

std::string TrimUtf8(const std::string& text) {
    return FromUnicode(TrimWhitespace(ToUnicode(text)));
}

bool IsBlank(const std::string& text) {
    return TrimWhitespace(ToUnicode(text)).isEmpty();
}

std::size_t CodepointLength(const std::string& text) {
    return static_cast<std::size_t>(ToUnicode(text).countChar32());
}

std::string ClipForLog(const std::string& text, std::size_t maxCodepoints) {
    auto unicode = ToUnicode(text);
    if (static_cast<std::size_t>(unicode.countChar32()) <= maxCodepoints) {
        return text;
    }

    unicode.truncate(unicode.moveIndex32(0, static_cast<int32_t>(maxCodepoints)));
    return FromUnicode(unicode) + "...";
}

std::vector<std::string> SplitPatternList(const std::string& raw) {
    std::vector<std::string> entries;
    std::string current;

    auto flush = [&entries, &current]() {
        auto trimmed = TrimUtf8(current);
        if (!trimmed.empty()) {
            entries.push_back(std::move(trimmed));
        }
        current.clear();
    };

    for (char c : raw) {
        if (c == ';' || c == ',') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();

    return entries;
}

std::string Join(const std::vector<std::string>& items, const std::string& separator) {
    std::ostringstream out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out << separator;
        }
        out << items[i];
    }
    return out.str();
}
