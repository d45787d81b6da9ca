/**
 * @file string_utils.hpp
 * @brief String manipulation and text decoding utilities
 *
 * Provides the small string helpers used across the sandbox (trim, split,
 * join, prefix checks), parsing of human-readable byte sizes, random
 * identifiers for containers and commands, and decoding of captured command
 * output from a named encoding to UTF-8 under an error-handling policy.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden {
namespace utils {

/**
 * @enum DecodeErrors
 * @brief What to do with byte sequences invalid in the source encoding
 */
enum class DecodeErrors {
    STRICT,            ///< Fail with DecodeError
    REPLACE,           ///< Substitute U+FFFD
    IGNORE,            ///< Drop the offending byte
    BACKSLASH_REPLACE  ///< Substitute the escape sequence \xNN
};

/**
 * @class DecodeError
 * @brief Raised by StringUtils::Decode under DecodeErrors::STRICT
 */
class DecodeError : public std::runtime_error {
public:
    DecodeError(const std::string& encoding, std::size_t offset)
        : std::runtime_error("'" + encoding + "' codec can't decode byte at position " +
                             std::to_string(offset))
        , encoding_(encoding)
        , offset_(offset) {}

    const std::string& Encoding() const { return encoding_; }
    std::size_t Offset() const { return offset_; }

private:
    std::string encoding_;
    std::size_t offset_;
};

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto text = StringUtils::Decode(raw_stdout, "utf-8", DecodeErrors::REPLACE);
 * auto bytes = StringUtils::ParseByteSize("4g");  // 4294967296
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert string to lowercase
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, skipping empty tokens
     *
     * **Example**:
     * @code
     * auto parts = StringUtils::Split("0-3,5", ',');
     * // parts = ["0-3", "5"]
     * @endcode
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);

    /***************************************************************************
     * Parsing and Identifiers
     ***************************************************************************/

    /**
     * @brief Parse a byte count with optional b/k/m/g suffix (binary multiples)
     *
     * @param text e.g. "512", "64k", "4g"
     * @return Number of bytes
     * @throws std::invalid_argument on malformed input
     */
    static std::int64_t ParseByteSize(const std::string& text);

    /**
     * @brief Random lowercase hex string of @p length characters
     * @throws std::runtime_error if the OpenSSL generator fails
     */
    static std::string RandomHex(std::size_t length);

    /***************************************************************************
     * Text Decoding
     ***************************************************************************/

    /**
     * @brief Normalize an encoding name ("UTF_8" -> "utf-8", "latin1" -> "latin-1")
     * @throws std::invalid_argument if the encoding is not supported
     */
    static std::string CanonicalEncoding(const std::string& name);

    /**
     * @brief Decode @p bytes from @p encoding into UTF-8
     *
     * Supported encodings: utf-8, ascii, latin-1.
     *
     * @throws DecodeError under DecodeErrors::STRICT when an invalid sequence is found
     * @throws std::invalid_argument for an unsupported encoding
     */
    static std::string Decode(const std::string& bytes,
                              const std::string& encoding,
                              DecodeErrors errors);

    /**
     * @brief Parse a policy name ("strict", "replace", "ignore", "backslashreplace")
     * @throws std::invalid_argument on unknown names
     */
    static DecodeErrors ParseDecodeErrors(const std::string& name);
};

} // namespace utils
} // namespace warden
