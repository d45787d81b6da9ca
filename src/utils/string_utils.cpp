/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation and text decoding utilities
 *
 * **UTF-8 Validation**:
 * Follows RFC 3629 well-formedness: no overlong forms, no surrogates
 * (U+D800..U+DFFF), nothing above U+10FFFF. An invalid unit is the lead
 * byte plus the continuation bytes that were still acceptable, so a
 * truncated multi-byte sequence yields a single replacement character.
 *
 * @date 2025
 */

#include "warden/utils/string_utils.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace warden {
namespace utils {

namespace {

constexpr const char* kReplacementCharacter = "\xEF\xBF\xBD";

void AppendCodepoint(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Length of the well-formed UTF-8 sequence at bytes[i], or 0 if invalid.
// On failure *consumed is the size of the invalid unit (always >= 1).
std::size_t Utf8SequenceLength(const std::string& bytes, std::size_t i, std::size_t* consumed) {
    auto at = [&bytes](std::size_t k) { return static_cast<unsigned char>(bytes[k]); };
    unsigned char lead = at(i);

    std::size_t length = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if (lead < 0x80) {
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead == 0xE0) {
        length = 3;
        lo = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        length = 3;
    } else if (lead == 0xED) {
        length = 3;
        hi = 0x9F;
    } else if (lead == 0xF0) {
        length = 4;
        lo = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        length = 4;
    } else if (lead == 0xF4) {
        length = 4;
        hi = 0x8F;
    } else {
        *consumed = 1;
        return 0;
    }

    for (std::size_t k = 1; k < length; ++k) {
        if (i + k >= bytes.size()) {
            *consumed = k;
            return 0;
        }
        unsigned char c = at(i + k);
        unsigned char min = k == 1 ? lo : 0x80;
        unsigned char max = k == 1 ? hi : 0xBF;
        if (c < min || c > max) {
            *consumed = k;
            return 0;
        }
    }
    return length;
}

void HandleInvalid(std::string& out, const std::string& bytes, std::size_t offset,
                   std::size_t length, const std::string& encoding, DecodeErrors errors) {
    switch (errors) {
        case DecodeErrors::STRICT:
            throw DecodeError(encoding, offset);
        case DecodeErrors::REPLACE:
            out += kReplacementCharacter;
            break;
        case DecodeErrors::IGNORE:
            break;
        case DecodeErrors::BACKSLASH_REPLACE: {
            static const char* digits = "0123456789abcdef";
            for (std::size_t k = 0; k < length; ++k) {
                auto c = static_cast<unsigned char>(bytes[offset + k]);
                out += "\\x";
                out.push_back(digits[c >> 4]);
                out.push_back(digits[c & 0x0F]);
            }
            break;
        }
    }
}

} // anonymous namespace

// ============================================================================
// BASIC STRING MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

// ============================================================================
// PARSING AND IDENTIFIERS
// ============================================================================

std::int64_t StringUtils::ParseByteSize(const std::string& text) {
    std::string value = ToLower(Trim(text));
    if (value.empty()) {
        throw std::invalid_argument("Empty byte size");
    }

    std::int64_t multiplier = 1;
    switch (value.back()) {
        case 'b': multiplier = 1; value.pop_back(); break;
        case 'k': multiplier = 1024; value.pop_back(); break;
        case 'm': multiplier = 1024LL * 1024; value.pop_back(); break;
        case 'g': multiplier = 1024LL * 1024 * 1024; value.pop_back(); break;
        default: break;
    }

    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Malformed byte size: '" + text + "'");
    }

    std::int64_t number = 0;
    try {
        number = std::stoll(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Byte size out of range: '" + text + "'");
    }
    if (number > std::numeric_limits<std::int64_t>::max() / multiplier) {
        throw std::invalid_argument("Byte size out of range: '" + text + "'");
    }
    return number * multiplier;
}

std::string StringUtils::RandomHex(std::size_t length) {
    static const char* digits = "0123456789abcdef";

    std::vector<unsigned char> bytes((length + 1) / 2);
    if (!bytes.empty() && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed: " +
                                 std::string(ERR_error_string(ERR_get_error(), nullptr)));
    }

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        unsigned char byte = bytes[i / 2];
        result.push_back(digits[i % 2 == 0 ? byte >> 4 : byte & 0x0F]);
    }
    return result;
}

// ============================================================================
// TEXT DECODING
// ============================================================================

std::string StringUtils::CanonicalEncoding(const std::string& name) {
    std::string compact;
    for (unsigned char c : ToLower(Trim(name))) {
        if (c != '-' && c != '_') {
            compact.push_back(static_cast<char>(c));
        }
    }

    if (compact == "utf8") {
        return "utf-8";
    }
    if (compact == "ascii" || compact == "usascii") {
        return "ascii";
    }
    if (compact == "latin1" || compact == "iso88591" || compact == "l1") {
        return "latin-1";
    }
    throw std::invalid_argument("Unsupported encoding: '" + name + "'");
}

DecodeErrors StringUtils::ParseDecodeErrors(const std::string& name) {
    std::string value = ToLower(Trim(name));
    if (value == "strict") {
        return DecodeErrors::STRICT;
    }
    if (value == "replace") {
        return DecodeErrors::REPLACE;
    }
    if (value == "ignore") {
        return DecodeErrors::IGNORE;
    }
    if (value == "backslashreplace") {
        return DecodeErrors::BACKSLASH_REPLACE;
    }
    throw std::invalid_argument("Unknown decode error policy: '" + name + "'");
}

std::string StringUtils::Decode(const std::string& bytes,
                                const std::string& encoding,
                                DecodeErrors errors) {
    const std::string canonical = CanonicalEncoding(encoding);

    std::string out;
    out.reserve(bytes.size());

    if (canonical == "latin-1") {
        for (unsigned char c : bytes) {
            AppendCodepoint(out, c);
        }
        return out;
    }

    std::size_t i = 0;
    while (i < bytes.size()) {
        auto c = static_cast<unsigned char>(bytes[i]);

        if (canonical == "ascii") {
            if (c < 0x80) {
                out.push_back(static_cast<char>(c));
            } else {
                HandleInvalid(out, bytes, i, 1, canonical, errors);
            }
            ++i;
            continue;
        }

        std::size_t consumed = 0;
        std::size_t length = Utf8SequenceLength(bytes, i, &consumed);
        if (length > 0) {
            out.append(bytes, i, length);
            i += length;
        } else {
            HandleInvalid(out, bytes, i, consumed, canonical, errors);
            i += consumed;
        }
    }
    return out;
}

} // namespace utils
} // namespace warden
