// mmap.h - Read-only memory-mapped input files
// Part of yamldiff - structural YAML diff

#ifndef YAMLDIFF_MMAP_H
#define YAMLDIFF_MMAP_H

#include <cstddef>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace yamldiff {

//=============================================================================
// MappedFile - Memory-mapped file input
//=============================================================================

struct MappedFile {
    int fd = -1;
    char* data = nullptr;
    size_t size = 0;
    std::string path;

    bool open_read(const char* p) {
        path = p;
        fd = ::open(p, O_RDONLY);
        if (fd < 0) return false;

        struct stat st;
        if (fstat(fd, &st) < 0 || !S_ISREG(st.st_mode)) { close(); return false; }
        size = st.st_size;

        // mmap fails with size 0
        if (size == 0) {
            data = nullptr;
            return true;
        }

        data = static_cast<char*>(mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0));
        if (data == MAP_FAILED) { data = nullptr; close(); return false; }

        madvise(data, size, MADV_SEQUENTIAL);
        return true;
    }

    std::string_view view() const {
        return data ? std::string_view(data, size) : std::string_view();
    }

    void close() {
        if (data) { munmap(data, size); data = nullptr; }
        if (fd >= 0) { ::close(fd); fd = -1; }
    }

    ~MappedFile() { close(); }

    // Non-copyable, moveable
    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    MappedFile(MappedFile&& other) noexcept
        : fd(other.fd), data(other.data), size(other.size), path(std::move(other.path)) {
        other.fd = -1;
        other.data = nullptr;
        other.size = 0;
    }
};

//=============================================================================
// Whole-input read ("-" is standard input)
//=============================================================================

inline bool read_input(const std::string& path, std::string& out) {
    if (path == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return !std::cin.bad();
    }
    MappedFile mf;
    if (mf.open_read(path.c_str())) {
        std::string_view v = mf.view();
        out.assign(v.data(), v.size());
        return true;
    }
    // Pipes and process substitutions cannot be mapped
    struct stat st;
    if (stat(path.c_str(), &st) < 0 || S_ISDIR(st.st_mode)) return false;
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

} // namespace yamldiff

#endif // YAMLDIFF_MMAP_H
