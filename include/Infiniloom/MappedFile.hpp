// =================================================================
// include/Infiniloom/MappedFile.hpp
// =================================================================
// Header for memory-mapped and buffered file reading.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Infiniloom {

/**
 * @brief Read-only memory mapping of a whole file
 *
 * The region owns both the mapping and the file descriptor it was made
 * from and releases them together. It is move-only; the bytes returned
 * by contents() become invalid once the region is closed or destroyed.
 * Zero-length files produce an open region with no mapping.
 */
class MappedRegion {
public:
    MappedRegion() = default;
    ~MappedRegion();

    MappedRegion(MappedRegion&& other) noexcept;
    MappedRegion& operator=(MappedRegion&& other) noexcept;
    MappedRegion(const MappedRegion&) = delete;
    MappedRegion& operator=(const MappedRegion&) = delete;

    /**
     * @brief Map a file by path
     * @param path File to map
     * @return Open region
     * @throws std::system_error if the file cannot be opened, stat'ed or mapped
     */
    static MappedRegion open(const std::string& path);

    /**
     * @brief Map a file relative to an open directory descriptor
     * @param dir_fd Directory descriptor (or AT_FDCWD)
     * @param name File name inside the directory
     * @return Open region
     * @throws std::system_error if the file cannot be opened, stat'ed or mapped
     */
    static MappedRegion openAt(int dir_fd, const std::string& name);

    /**
     * @brief Unmap the file and close its descriptor. Safe to call twice.
     */
    void close() noexcept;

    bool isOpen() const { return m_fd >= 0; }
    const char* data() const { return static_cast<const char*>(m_data); }
    size_t size() const { return m_size; }
    std::string_view contents() const { return std::string_view(data(), m_size); }

    /**
     * @brief Hint that the region will be read front to back
     */
    void adviseSequential() const;

    /**
     * @brief Hint that the pages are no longer needed
     */
    void adviseDontNeed() const;

private:
    int m_fd = -1;
    void* m_data = nullptr;
    size_t m_size = 0;

    static MappedRegion mapDescriptor(int fd, const std::string& name);
};

/**
 * @brief File bytes held either as a mapping or as a heap buffer
 *
 * Releases whichever resource it holds when destroyed.
 */
class FileContent {
public:
    FileContent() = default;
    explicit FileContent(MappedRegion region);
    explicit FileContent(std::string buffer);

    FileContent(FileContent&&) noexcept = default;
    FileContent& operator=(FileContent&&) noexcept = default;
    FileContent(const FileContent&) = delete;
    FileContent& operator=(const FileContent&) = delete;

    const char* data() const;
    size_t size() const;
    bool isMapped() const { return m_mapped; }
    std::string_view view() const { return std::string_view(data(), size()); }

    /**
     * @brief Copy the bytes into a new string
     */
    std::string toString() const { return std::string(view()); }

    /**
     * @brief Move the bytes out as a string and release this content
     *
     * A heap buffer is moved out without copying; a mapping is copied
     * and then unmapped.
     */
    std::string takeString();

    /**
     * @brief Release the mapping or buffer early
     */
    void release() noexcept;

private:
    MappedRegion m_region;
    std::string m_buffer;
    bool m_mapped = false;
};

/**
 * @brief Chooses between mapped and buffered reads by file size
 */
class SmartReader {
public:
    static constexpr uint64_t DEFAULT_MMAP_THRESHOLD = 64 * 1024;  // 64KB

    explicit SmartReader(uint64_t mmap_threshold = DEFAULT_MMAP_THRESHOLD, bool use_mmap = true)
        : m_mmap_threshold(mmap_threshold), m_use_mmap(use_mmap) {}

    /**
     * @brief Read a whole file
     *
     * Files of at least the threshold size are mapped, smaller ones are
     * read into a heap buffer. Empty files yield empty content.
     *
     * @param path File to read
     * @param max_size Largest accepted file size in bytes
     * @return Content handle
     * @throws std::system_error on I/O failure or if the file exceeds max_size
     */
    FileContent read(const std::string& path, uint64_t max_size) const;

    uint64_t getMmapThreshold() const { return m_mmap_threshold; }

private:
    uint64_t m_mmap_threshold;
    bool m_use_mmap;
};

} // namespace Infiniloom
