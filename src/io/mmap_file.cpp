#include "io/mmap_file.hpp"

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

namespace sigindex {

MmapFile::~MmapFile() {
    release();
}

MmapFile::MmapFile(MmapFile&& other) noexcept
    : data_(std::exchange(other.data_, nullptr)),
      size_(std::exchange(other.size_, 0)),
      path_(std::move(other.path_)) {}

MmapFile& MmapFile::operator=(MmapFile&& other) noexcept {
    if (this != &other) {
        release();
        data_ = std::exchange(other.data_, nullptr);
        size_ = std::exchange(other.size_, 0);
        path_ = std::move(other.path_);
    }
    return *this;
}

bool MmapFile::open(const std::string& path, bool quiet) {
    close();

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (!quiet)
            std::fprintf(stderr, "MmapFile: cannot open '%s': %s\n",
                         path.c_str(), strerror(errno));
        return false;
    }

    struct stat st;
    if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        std::fprintf(stderr, "MmapFile: '%s' is not a regular file\n", path.c_str());
        ::close(fd);
        return false;
    }
    if (st.st_size == 0) {
        if (!quiet)
            std::fprintf(stderr, "MmapFile: '%s' is empty\n", path.c_str());
        ::close(fd);
        return false;
    }

    void* mapped = ::mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ,
                          MAP_PRIVATE, fd, 0);
    ::close(fd);
    if (mapped == MAP_FAILED) {
        std::fprintf(stderr, "MmapFile: mmap failed for '%s': %s\n",
                     path.c_str(), strerror(errno));
        return false;
    }

    data_ = static_cast<uint8_t*>(mapped);
    size_ = static_cast<size_t>(st.st_size);
    path_ = path;
    return true;
}

bool MmapFile::advise(int advice) {
    if (!data_) return false;
    return ::madvise(data_, size_, advice) == 0;
}

void MmapFile::close() {
    release();
    path_.clear();
}

void MmapFile::release() {
    if (data_) {
        ::munmap(data_, size_);
        data_ = nullptr;
        size_ = 0;
    }
}

} // namespace sigindex
