// =================================================================
// tests/MappedFileTest.cpp
// =================================================================
// Unit tests for mapped regions and the threshold-based reader.

#include "Infiniloom/MappedFile.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

using Infiniloom::FileContent;
using Infiniloom::MappedRegion;
using Infiniloom::SmartReader;

class MappedFileTest {
private:
    fs::path test_dir;

    std::string writeFile(const std::string& name, const std::string& content) {
        fs::path file = test_dir / name;
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file.string();
    }

    static std::string makeContent(size_t size) {
        std::string content;
        content.reserve(size);
        for (size_t i = 0; i < size; ++i) {
            content.push_back(static_cast<char>('a' + (i * 7) % 26));
            if (i % 80 == 79) {
                content.back() = '\n';
            }
        }
        return content;
    }

public:
    MappedFileTest()
        : test_dir(fs::temp_directory_path() / ("infiniloom_mmap_" + std::to_string(::getpid()))) {
        fs::create_directories(test_dir);
    }

    ~MappedFileTest() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void testMappedRegion() {
        std::cout << "Testing mapped region lifecycle..." << std::endl;

        const std::string content = makeContent(5000);
        const std::string path = writeFile("region.txt", content);

        MappedRegion region = MappedRegion::open(path);
        assert(region.isOpen());
        assert(region.size() == content.size());
        assert(region.contents() == content);

        // Ownership moves with the region
        MappedRegion moved = std::move(region);
        assert(!region.isOpen());
        assert(region.data() == nullptr);
        assert(moved.isOpen());
        assert(moved.contents() == content);

        moved.close();
        assert(!moved.isOpen());
        assert(moved.size() == 0);
        moved.close();  // second close is a no-op

        std::cout << "✓ Mapped region lifecycle test passed" << std::endl;
    }

    void testEmptyFileRegion() {
        std::cout << "Testing empty file mapping..." << std::endl;

        const std::string path = writeFile("empty.txt", "");
        MappedRegion region = MappedRegion::open(path);
        assert(region.isOpen());
        assert(region.size() == 0);
        assert(region.contents().empty());

        std::cout << "✓ Empty file mapping test passed" << std::endl;
    }

    void testOpenFailure() {
        std::cout << "Testing open failure..." << std::endl;

        bool threw = false;
        try {
            MappedRegion::open((test_dir / "missing.txt").string());
        } catch (const std::system_error& e) {
            threw = true;
            assert(e.code() == std::errc::no_such_file_or_directory);
        }
        assert(threw && "Opening a missing file must throw");

        std::cout << "✓ Open failure test passed" << std::endl;
    }

    void testReaderPaths() {
        std::cout << "Testing mapped and buffered reads agree..." << std::endl;

        const std::string content = makeContent(200 * 1024);
        const std::string path = writeFile("large.txt", content);

        SmartReader mapping_reader(64 * 1024, true);
        FileContent mapped = mapping_reader.read(path, content.size());
        assert(mapped.isMapped());
        assert(mapped.size() == content.size());

        SmartReader buffered_reader(64 * 1024, false);
        FileContent buffered = buffered_reader.read(path, content.size());
        assert(!buffered.isMapped());

        assert(mapped.view() == buffered.view() && "Both paths must yield identical bytes");
        assert(mapped.toString() == content);

        // Below the threshold the buffered path is used
        const std::string small_path = writeFile("small.txt", "tiny file\n");
        FileContent small = mapping_reader.read(small_path, 1024);
        assert(!small.isMapped());
        assert(small.toString() == "tiny file\n");

        std::cout << "✓ Mapped and buffered reads agree test passed" << std::endl;
    }

    void testTakeString() {
        std::cout << "Testing content ownership transfer..." << std::endl;

        const std::string content = makeContent(100 * 1024);
        const std::string path = writeFile("take.txt", content);

        SmartReader reader(1024, true);
        FileContent mapped = reader.read(path, content.size());
        assert(mapped.isMapped());
        std::string copied = mapped.takeString();
        assert(copied == content);
        assert(mapped.size() == 0 && "Mapping is released after takeString");

        SmartReader buffered_reader(1024, false);
        FileContent buffered = buffered_reader.read(path, content.size());
        std::string taken = buffered.takeString();
        assert(taken == content);
        assert(buffered.size() == 0);

        std::cout << "✓ Content ownership transfer test passed" << std::endl;
    }

    void testSizeLimit() {
        std::cout << "Testing size limit..." << std::endl;

        const std::string path = writeFile("limit.txt", makeContent(4096));

        SmartReader reader;
        bool threw = false;
        try {
            reader.read(path, 1024);
        } catch (const std::system_error& e) {
            threw = true;
            assert(e.code() == std::errc::file_too_large);
        }
        assert(threw && "Oversized files must be refused");

        FileContent empty = reader.read(writeFile("zero.txt", ""), 0);
        assert(empty.size() == 0);

        std::cout << "✓ Size limit test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running MappedFile unit tests..." << std::endl;

        testMappedRegion();
        testEmptyFileRegion();
        testOpenFailure();
        testReaderPaths();
        testTakeString();
        testSizeLimit();

        std::cout << "All MappedFile tests passed!" << std::endl;
    }
};

int main() {
    try {
        MappedFileTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
