#pragma once

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace imagesmith {

/**
 * @brief Read-only memory mapping of a whole file, released on destruction.
 *
 * Empty files are not mapped; `content()` is then empty.
 * @throws std::runtime_error if the file cannot be opened, stated or mapped.
 */
class MappedFile {
public:
    explicit MappedFile(const std::filesystem::path &path) {
        fd_ = open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ == -1) {
            throw std::runtime_error(describe("open", path));
        }

        struct stat sb;
        if (fstat(fd_, &sb) == -1) {
            std::string msg = describe("stat", path);
            close(fd_);
            throw std::runtime_error(msg);
        }
        size_ = static_cast<size_t>(sb.st_size);
        if (size_ == 0) {
            return;
        }

        posix_fadvise(fd_, 0, 0, POSIX_FADV_SEQUENTIAL);

        void *addr = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (addr == MAP_FAILED) {
            std::string msg = describe("mmap", path);
            close(fd_);
            throw std::runtime_error(msg);
        }
        data_ = static_cast<char *>(addr);
    }

    ~MappedFile() {
        if (data_) {
            munmap(data_, size_);
        }
        if (fd_ != -1) {
            close(fd_);
        }
    }

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

private:
    static std::string describe(const char *what, const std::filesystem::path &path) {
        return std::string("Failed to ") + what + " " + path.string() + ": " + std::strerror(errno);
    }

    int fd_ = -1;
    char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace imagesmith
