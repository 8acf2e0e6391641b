// =================================================================
// include/Infiniloom/ContentClassifier.hpp
// =================================================================
// Header for binary/text classification and encoding detection.

#pragma once

#include <cstddef>
#include <string>

namespace Infiniloom {

/**
 * @brief Text encodings recognized by detectEncoding()
 */
enum class Encoding {
    UTF8,
    UTF8_BOM,
    UTF16_LE,
    UTF16_BE,
    UTF32_LE,
    UTF32_BE,
    ASCII,
    LATIN1,
    UNKNOWN
};

/**
 * @brief Stateless classifier for file content
 *
 * Works on a leading sample of a file. Every method is a pure function
 * of its input and safe to call from any thread.
 */
class ContentClassifier {
public:
    /// Number of leading bytes inspected by the heuristics
    static constexpr size_t SAMPLE_SIZE = 8192;

    /**
     * @brief Decide whether a buffer holds binary data
     *
     * Checks, in order: known file signatures, a null byte in the
     * sample, more than 10% disallowed control characters, and invalid
     * UTF-8 when the sample contains bytes above 0x7F.
     *
     * @param data Buffer start
     * @param size Buffer length
     * @return true if the content should be treated as binary
     */
    static bool isBinary(const char* data, size_t size);
    static bool isBinary(const std::string& data) { return isBinary(data.data(), data.size()); }

    /**
     * @brief Check the buffer start against known binary signatures
     *        (images, archives, executables, media, documents, fonts,
     *        databases)
     * @param data Buffer start
     * @param size Buffer length, signatures need at least 4 bytes
     * @return true if a signature matches
     */
    static bool hasBinarySignature(const char* data, size_t size);

    /**
     * @brief Detect the text encoding from byte-order marks and UTF-8
     *        validity
     * @param data Buffer start
     * @param size Buffer length
     * @return Detected encoding, ASCII for an empty buffer
     */
    static Encoding detectEncoding(const char* data, size_t size);
    static Encoding detectEncoding(const std::string& data) { return detectEncoding(data.data(), data.size()); }

    /**
     * @brief Get a display name for an encoding ("UTF-8", "UTF-16 LE", ...)
     */
    static std::string encodingName(Encoding encoding);

    /**
     * @brief Validate UTF-8
     *
     * A multi-byte sequence cut off by the end of the buffer is accepted,
     * since the buffer is usually a prefix of a longer file.
     *
     * @param data Buffer start
     * @param size Buffer length
     * @return true if no invalid sequence was found
     */
    static bool isValidUtf8(const char* data, size_t size);
};

} // namespace Infiniloom
