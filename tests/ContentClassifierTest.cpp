// =================================================================
// tests/ContentClassifierTest.cpp
// =================================================================
// Unit tests for binary detection and encoding classification.

#include "Infiniloom/ContentClassifier.hpp"
#include <cassert>
#include <iostream>
#include <string>

using Infiniloom::ContentClassifier;
using Infiniloom::Encoding;

class ContentClassifierTest {
public:
    void testTextIsNotBinary() {
        std::cout << "Testing plain text classification..." << std::endl;

        assert(!ContentClassifier::isBinary(std::string("def main():\n    print('hello')\n")));
        assert(!ContentClassifier::isBinary(std::string("line one\r\nline two\twith tab\n")));
        assert(!ContentClassifier::isBinary(std::string("caf\xC3\xA9 \xE2\x82\xAC 100")) && "Valid UTF-8 is text");
        assert(!ContentClassifier::isBinary(std::string()) && "Empty input is text");
        assert(!ContentClassifier::isBinary(nullptr, 10));

        std::cout << "✓ Plain text classification test passed" << std::endl;
    }

    void testNullByteIsBinary() {
        std::cout << "Testing null byte detection..." << std::endl;

        std::string data = "hello world";
        data.push_back('\0');
        data += "more text";
        assert(ContentClassifier::isBinary(data));

        std::string single(1, '\0');
        assert(ContentClassifier::isBinary(single));

        std::cout << "✓ Null byte detection test passed" << std::endl;
    }

    void testSignatures() {
        std::cout << "Testing binary signatures..." << std::endl;

        const std::string elf("\x7F\x45\x4C\x46\x02\x01\x01", 7);
        assert(ContentClassifier::hasBinarySignature(elf.data(), elf.size()));
        assert(ContentClassifier::isBinary(elf));

        const std::string png("\x89PNG\r\n\x1A\n", 8);
        assert(ContentClassifier::isBinary(png));

        const std::string pdf("%PDF-1.7\n");
        assert(ContentClassifier::hasBinarySignature(pdf.data(), pdf.size()));

        const std::string gzip("\x1F\x8B\x08\x00", 4);
        assert(ContentClassifier::isBinary(gzip));

        assert(!ContentClassifier::hasBinarySignature("\x7F\x45", 2) && "Short buffers have no signature");
        assert(!ContentClassifier::hasBinarySignature("text", 4));

        std::cout << "✓ Binary signatures test passed" << std::endl;
    }

    void testControlCharacters() {
        std::cout << "Testing control character ratio..." << std::endl;

        std::string noisy(100, 'a');
        for (size_t i = 0; i < 20; ++i) {
            noisy[i * 5] = '\x01';
        }
        assert(ContentClassifier::isBinary(noisy) && "Over 10% control bytes is binary");

        std::string mostly_text(100, 'a');
        mostly_text[10] = '\x1B';
        assert(!ContentClassifier::isBinary(mostly_text) && "A stray escape byte is still text");

        std::cout << "✓ Control character ratio test passed" << std::endl;
    }

    void testInvalidUtf8() {
        std::cout << "Testing UTF-8 validation..." << std::endl;

        assert(ContentClassifier::isValidUtf8("abc", 3));
        assert(ContentClassifier::isValidUtf8("\xC3\xA9", 2));
        assert(ContentClassifier::isValidUtf8("\xF0\x9F\x98\x80", 4));
        assert(!ContentClassifier::isValidUtf8("\xC0\xAF", 2) && "Overlong encoding");
        assert(!ContentClassifier::isValidUtf8("\xED\xA0\x80", 3) && "Surrogate half");
        assert(!ContentClassifier::isValidUtf8("\xFF\xFE\xFD", 3));
        assert(ContentClassifier::isValidUtf8("abc\xE2\x82", 5) && "Truncated tail is accepted");

        std::string latin1 = "na\xEFve r\xE9sum\xE9 text";
        assert(ContentClassifier::isBinary(latin1) && "Invalid UTF-8 high bytes are binary");

        std::cout << "✓ UTF-8 validation test passed" << std::endl;
    }

    void testSampleBoundary() {
        std::cout << "Testing sample boundary handling..." << std::endl;

        // A multi-byte character split by the end of the sample
        std::string text(ContentClassifier::SAMPLE_SIZE - 1, 'x');
        text += "\xE2\x82\xAC";
        assert(!ContentClassifier::isBinary(text));

        // Bytes past the sample are never inspected
        std::string late(ContentClassifier::SAMPLE_SIZE + 16, 'y');
        late[ContentClassifier::SAMPLE_SIZE + 8] = '\0';
        assert(!ContentClassifier::isBinary(late));

        std::cout << "✓ Sample boundary handling test passed" << std::endl;
    }

    void testEncodingDetection() {
        std::cout << "Testing encoding detection..." << std::endl;

        assert(ContentClassifier::detectEncoding(std::string("plain")) == Encoding::ASCII);
        assert(ContentClassifier::detectEncoding(std::string("caf\xC3\xA9")) == Encoding::UTF8);
        assert(ContentClassifier::detectEncoding(std::string("\xEF\xBB\xBFhi")) == Encoding::UTF8_BOM);
        assert(ContentClassifier::detectEncoding(std::string("\xFF\xFEh\0", 4)) == Encoding::UTF16_LE);
        assert(ContentClassifier::detectEncoding(std::string("\xFE\xFF\0h", 4)) == Encoding::UTF16_BE);
        assert(ContentClassifier::detectEncoding(std::string("\xFF\xFE\0\0", 4)) == Encoding::UTF32_LE);
        assert(ContentClassifier::detectEncoding(std::string("\0\0\xFE\xFF", 4)) == Encoding::UTF32_BE);
        assert(ContentClassifier::detectEncoding(std::string("r\xE9sum\xE9")) == Encoding::LATIN1);

        assert(ContentClassifier::encodingName(Encoding::UTF8) == "UTF-8");
        assert(ContentClassifier::encodingName(Encoding::UTF8_BOM) == "UTF-8 with BOM");
        assert(ContentClassifier::encodingName(Encoding::LATIN1) == "Latin-1");
        assert(ContentClassifier::encodingName(Encoding::UNKNOWN) == "Unknown");

        std::cout << "✓ Encoding detection test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ContentClassifier unit tests..." << std::endl;

        testTextIsNotBinary();
        testNullByteIsBinary();
        testSignatures();
        testControlCharacters();
        testInvalidUtf8();
        testSampleBoundary();
        testEncodingDetection();

        std::cout << "All ContentClassifier tests passed!" << std::endl;
    }
};

int main() {
    try {
        ContentClassifierTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
