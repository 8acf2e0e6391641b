// =================================================================
// src/Infiniloom/MappedFile.cpp
// =================================================================
// Implementation for memory-mapped and buffered file reading.

#include "Infiniloom/MappedFile.hpp"
#include <cerrno>
#include <fstream>
#include <system_error>
#include <utility>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Infiniloom {

namespace {

[[noreturn]] void throwErrno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

} // namespace

MappedRegion::~MappedRegion() {
    close();
}

MappedRegion::MappedRegion(MappedRegion&& other) noexcept
    : m_fd(std::exchange(other.m_fd, -1)),
      m_data(std::exchange(other.m_data, nullptr)),
      m_size(std::exchange(other.m_size, 0)) {}

MappedRegion& MappedRegion::operator=(MappedRegion&& other) noexcept {
    if (this != &other) {
        close();
        m_fd = std::exchange(other.m_fd, -1);
        m_data = std::exchange(other.m_data, nullptr);
        m_size = std::exchange(other.m_size, 0);
    }
    return *this;
}

MappedRegion MappedRegion::open(const std::string& path) {
    return openAt(AT_FDCWD, path);
}

MappedRegion MappedRegion::openAt(int dir_fd, const std::string& name) {
    int fd = ::openat(dir_fd, name.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throwErrno("Cannot open " + name);
    }
    return mapDescriptor(fd, name);
}

MappedRegion MappedRegion::mapDescriptor(int fd, const std::string& name) {
    MappedRegion region;
    region.m_fd = fd;

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        throwErrno("Cannot stat " + name);
    }

    region.m_size = static_cast<size_t>(st.st_size);
    if (region.m_size == 0) {
        return region;
    }

    void* data = ::mmap(nullptr, region.m_size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (data == MAP_FAILED) {
        region.m_size = 0;
        throwErrno("Cannot map " + name);
    }
    region.m_data = data;
    return region;
}

void MappedRegion::close() noexcept {
    if (m_data != nullptr) {
        ::munmap(m_data, m_size);
        m_data = nullptr;
    }
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
    m_size = 0;
}

void MappedRegion::adviseSequential() const {
    if (m_data != nullptr) {
        ::madvise(m_data, m_size, MADV_SEQUENTIAL);
    }
}

void MappedRegion::adviseDontNeed() const {
    if (m_data != nullptr) {
        ::madvise(m_data, m_size, MADV_DONTNEED);
    }
}

// FileContent implementation

FileContent::FileContent(MappedRegion region)
    : m_region(std::move(region)), m_mapped(true) {}

FileContent::FileContent(std::string buffer)
    : m_buffer(std::move(buffer)), m_mapped(false) {}

const char* FileContent::data() const {
    return m_mapped ? m_region.data() : m_buffer.data();
}

size_t FileContent::size() const {
    return m_mapped ? m_region.size() : m_buffer.size();
}

std::string FileContent::takeString() {
    std::string result;
    if (m_mapped) {
        result.assign(m_region.data(), m_region.size());
    } else {
        result = std::move(m_buffer);
    }
    release();
    return result;
}

void FileContent::release() noexcept {
    m_region.close();
    m_buffer.clear();
    m_buffer.shrink_to_fit();
}

// SmartReader implementation

FileContent SmartReader::read(const std::string& path, uint64_t max_size) const {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        throwErrno("Cannot stat " + path);
    }

    uint64_t size = static_cast<uint64_t>(st.st_size);
    if (size == 0) {
        return FileContent(std::string());
    }
    if (size > max_size) {
        throw std::system_error(std::make_error_code(std::errc::file_too_large),
                                path + " exceeds " + std::to_string(max_size) + " bytes");
    }

    if (m_use_mmap && size >= m_mmap_threshold) {
        MappedRegion region = MappedRegion::open(path);
        region.adviseSequential();
        return FileContent(std::move(region));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throwErrno("Cannot open " + path);
    }

    std::string buffer(static_cast<size_t>(size), '\0');
    file.read(&buffer[0], static_cast<std::streamsize>(size));
    if (file.bad()) {
        throw std::system_error(std::make_error_code(std::errc::io_error), "Cannot read " + path);
    }
    buffer.resize(static_cast<size_t>(file.gcount()));
    return FileContent(std::move(buffer));
}

} // namespace Infiniloom
