#pragma once

#include <boost/optional.hpp>

#include <string>

namespace security {

// Decodes standard-alphabet base64 with the leniency of a non-validating
// decoder: the data length may not be 1 more than a multiple of 4, and a
// partial final quantum must carry enough '=' padding. Returns none for
// anything else; the decoded bytes are not required to be valid UTF-8.
boost::optional<std::string> DecodeBase64(const std::string& encoded);

} // namespace security
