#include "security/Base64.hpp"

namespace security {

namespace {

int DecodeSextet(char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '+') {
        return 62;
    }
    if (c == '/') {
        return 63;
    }

    return -1;
}

} // namespace

boost::optional<std::string> DecodeBase64(const std::string& encoded) {
    auto dataLength = encoded.find('=');
    if (dataLength == std::string::npos) {
        dataLength = encoded.size();
    }

    for (size_t i = dataLength; i < encoded.size(); ++i) {
        if (encoded[i] != '=') {
            return boost::none;
        }
    }

    const size_t padding = encoded.size() - dataLength;
    switch (dataLength % 4) {
    case 1:
        return boost::none;
    case 2:
        if (padding < 2) {
            return boost::none;
        }
        break;
    case 3:
        if (padding < 1) {
            return boost::none;
        }
        break;
    default:
        break;
    }

    std::string decoded;
    decoded.reserve(dataLength / 4 * 3 + 2);

    int accumulator = 0;
    int bits = -8;
    for (size_t i = 0; i < dataLength; ++i) {
        const int sextet = DecodeSextet(encoded[i]);
        if (sextet < 0) {
            return boost::none;
        }

        accumulator = ((accumulator << 6) | sextet) & 0xFFFFFF;
        bits += 6;
        if (bits >= 0) {
            decoded.push_back(static_cast<char>((accumulator >> bits) & 0xFF));
            bits -= 8;
        }
    }

    return decoded;
}

} // namespace security
