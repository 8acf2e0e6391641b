// =================================================================
// src/Infiniloom/ContentClassifier.cpp
// =================================================================
// Implementation for binary/text classification and encoding detection.

#include "Infiniloom/ContentClassifier.hpp"
#include <algorithm>
#include <cstring>

namespace Infiniloom {

namespace {

struct Signature {
    const char* bytes;
    size_t length;
};

// Leading bytes of common binary formats
const Signature BINARY_SIGNATURES[] = {
    // Images
    {"\xFF\xD8\xFF", 3},                 // JPEG
    {"\x89\x50\x4E\x47", 4},             // PNG
    {"\x47\x49\x46\x38", 4},             // GIF
    {"\x42\x4D", 2},                     // BMP
    {"\x00\x00\x01\x00", 4},             // ICO
    {"\x52\x49\x46\x46", 4},             // RIFF (WEBP, WAV, AVI)

    // Archives
    {"\x50\x4B\x03\x04", 4},             // ZIP, JAR, DOCX
    {"\x1F\x8B", 2},                     // GZIP
    {"\x42\x5A\x68", 3},                 // BZIP2
    {"\xFD\x37\x7A\x58\x5A", 5},         // XZ
    {"\x37\x7A\xBC\xAF\x27\x1C", 6},     // 7Z
    {"\x52\x61\x72\x21", 4},             // RAR

    // Executables
    {"\x7F\x45\x4C\x46", 4},             // ELF
    {"\x4D\x5A", 2},                     // DOS/PE
    {"\xCF\xFA\xED\xFE", 4},             // Mach-O 64-bit
    {"\xCE\xFA\xED\xFE", 4},             // Mach-O 32-bit
    {"\xCA\xFE\xBA\xBE", 4},             // Java class, universal Mach-O

    // Audio
    {"\x49\x44\x33", 3},                 // MP3 with ID3
    {"\xFF\xFB", 2},                     // MP3
    {"\x66\x4C\x61\x43", 4},             // FLAC

    // Documents
    {"\x25\x50\x44\x46", 4},             // PDF
    {"\xD0\xCF\x11\xE0", 4},             // MS Office (OLE)

    // Fonts
    {"\x00\x01\x00\x00", 4},             // TrueType
    {"\x4F\x54\x54\x4F", 4},             // OpenType
    {"\x77\x4F\x46\x46", 4},             // WOFF
    {"\x77\x4F\x46\x32", 4},             // WOFF2

    // Databases
    {"\x53\x51\x4C\x69\x74\x65", 6}      // SQLite
};

bool isAllowedControl(unsigned char byte) {
    return byte == '\t' || byte == '\n' || byte == '\r';
}

bool isContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

} // namespace

bool ContentClassifier::isBinary(const char* data, size_t size) {
    if (data == nullptr || size == 0) {
        return false;
    }

    if (hasBinarySignature(data, size)) {
        return true;
    }

    const size_t check_len = std::min(size, SAMPLE_SIZE);
    size_t control_count = 0;
    size_t high_byte_count = 0;

    for (size_t i = 0; i < check_len; ++i) {
        unsigned char byte = static_cast<unsigned char>(data[i]);
        if (byte == 0) {
            // Any null byte is conclusive
            return true;
        } else if (byte < 32 && !isAllowedControl(byte)) {
            control_count++;
        } else if (byte > 127) {
            high_byte_count++;
        }
    }

    // More than 10% control characters
    if (control_count * 10 > check_len) {
        return true;
    }

    if (high_byte_count > 0 && !isValidUtf8(data, check_len)) {
        return true;
    }

    return false;
}

bool ContentClassifier::hasBinarySignature(const char* data, size_t size) {
    if (data == nullptr || size < 4) {
        return false;
    }

    for (const auto& signature : BINARY_SIGNATURES) {
        if (size >= signature.length &&
            std::memcmp(data, signature.bytes, signature.length) == 0) {
            return true;
        }
    }
    return false;
}

Encoding ContentClassifier::detectEncoding(const char* data, size_t size) {
    if (data == nullptr || size == 0) {
        return Encoding::ASCII;
    }

    const auto* bytes = reinterpret_cast<const unsigned char*>(data);

    // Byte order marks, longest first
    if (size >= 4) {
        if (bytes[0] == 0xFF && bytes[1] == 0xFE && bytes[2] == 0x00 && bytes[3] == 0x00) {
            return Encoding::UTF32_LE;
        }
        if (bytes[0] == 0x00 && bytes[1] == 0x00 && bytes[2] == 0xFE && bytes[3] == 0xFF) {
            return Encoding::UTF32_BE;
        }
    }
    if (size >= 3 && bytes[0] == 0xEF && bytes[1] == 0xBB && bytes[2] == 0xBF) {
        return Encoding::UTF8_BOM;
    }
    if (size >= 2) {
        if (bytes[0] == 0xFF && bytes[1] == 0xFE) {
            return Encoding::UTF16_LE;
        }
        if (bytes[0] == 0xFE && bytes[1] == 0xFF) {
            return Encoding::UTF16_BE;
        }
    }

    if (isValidUtf8(data, size)) {
        bool has_high_byte = std::any_of(bytes, bytes + size,
                                         [](unsigned char byte) { return byte > 127; });
        return has_high_byte ? Encoding::UTF8 : Encoding::ASCII;
    }

    return Encoding::LATIN1;
}

std::string ContentClassifier::encodingName(Encoding encoding) {
    switch (encoding) {
        case Encoding::UTF8: return "UTF-8";
        case Encoding::UTF8_BOM: return "UTF-8 with BOM";
        case Encoding::UTF16_LE: return "UTF-16 LE";
        case Encoding::UTF16_BE: return "UTF-16 BE";
        case Encoding::UTF32_LE: return "UTF-32 LE";
        case Encoding::UTF32_BE: return "UTF-32 BE";
        case Encoding::ASCII: return "ASCII";
        case Encoding::LATIN1: return "Latin-1";
        default: return "Unknown";
    }
}

bool ContentClassifier::isValidUtf8(const char* data, size_t size) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    size_t i = 0;

    while (i < size) {
        unsigned char lead = bytes[i];
        if (lead < 0x80) {
            i++;
            continue;
        }

        size_t length;
        unsigned char min_second = 0x80;
        unsigned char max_second = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) {
                min_second = 0xA0;  // overlong
            } else if (lead == 0xED) {
                max_second = 0x9F;  // surrogates
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) {
                min_second = 0x90;  // overlong
            } else if (lead == 0xF4) {
                max_second = 0x8F;  // above U+10FFFF
            }
        } else {
            return false;
        }

        for (size_t k = 1; k < length; ++k) {
            if (i + k >= size) {
                // Sequence cut off by the end of the sample
                return true;
            }
            unsigned char byte = bytes[i + k];
            if (!isContinuation(byte)) {
                return false;
            }
            if (k == 1 && (byte < min_second || byte > max_second)) {
                return false;
            }
        }
        i += length;
    }

    return true;
}

} // namespace Infiniloom
