#include "fs.hpp"

#include <cerrno>
#include <system_error>
#include <utility>
#include <vector>
#include <fmt/core.h>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace mtcopy::adapters::fs {

namespace {

constexpr std::size_t kBufferSize = 256 * 1024;

auto last_error() -> std::error_code {
    return {errno, std::system_category()};
}

// Владеет файловым дескриптором
class ScopedFd {
public:
    ScopedFd() = default;
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    ScopedFd(ScopedFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    ScopedFd& operator=(ScopedFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    [[nodiscard]] auto get() const -> int { return fd_; }
    [[nodiscard]] auto valid() const -> bool { return fd_ >= 0; }

    // close() на записываемом файле может сообщить об отложенной ошибке записи
    auto close() -> std::error_code {
        std::error_code ec;
        if (fd_ >= 0 && ::close(fd_) != 0) {
            ec = last_error();
        }
        fd_ = -1;
        return ec;
    }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

auto open_source(const std::filesystem::path& src, ScopedFd& fd) -> infra::VoidResult {
    fd = ScopedFd(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return std::unexpected(infra::make_system_error(
            last_error(), fmt::format("Cannot open source {}", src.string())));
    }
    return {};
}

auto open_destination(const std::filesystem::path& dst, ScopedFd& fd) -> infra::VoidResult {
    fd = ScopedFd(::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        return std::unexpected(infra::make_system_error(
            last_error(), fmt::format("Cannot create destination {}", dst.string())));
    }
    return {};
}

// Пишет весь буфер, повторяя при частичной записи и EINTR
auto write_all(int fd, const char* data, std::size_t size) -> std::error_code {
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return last_error();
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return {};
}

auto finish_destination(ScopedFd& dst_fd, const std::filesystem::path& dst) -> infra::VoidResult {
    if (auto ec = dst_fd.close(); ec) {
        return std::unexpected(infra::make_system_error(
            ec, fmt::format("Cannot finalize {}", dst.string())));
    }
    return {};
}

} // namespace

auto select_strategy(std::uintmax_t file_size) -> CopyStrategy {
    if (file_size < 1'000'000) return CopyStrategy::Buffered;      // < 1 MB
    return CopyStrategy::MMap;
}

// =============== Buffered I/O ===============
auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult {
    ScopedFd src_fd;
    if (auto res = open_source(src, src_fd); !res) return res;

    ScopedFd dst_fd;
    if (auto res = open_destination(dst, dst_fd); !res) return res;

    std::vector<char> buffer(kBufferSize);
    for (;;) {
        const ssize_t bytes_read = ::read(src_fd.get(), buffer.data(), buffer.size());
        if (bytes_read < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_system_error(
                last_error(), fmt::format("Read error in {}", src.string())));
        }
        if (bytes_read == 0) break;

        if (auto ec = write_all(dst_fd.get(), buffer.data(), static_cast<std::size_t>(bytes_read)); ec) {
            return std::unexpected(infra::make_system_error(
                ec, fmt::format("Write error in {}", dst.string())));
        }
    }

    return finish_destination(dst_fd, dst);
}

// =============== Memory-mapped I/O ===============
auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult {
    ScopedFd src_fd;
    if (auto res = open_source(src, src_fd); !res) return res;

    struct stat sb;
    if (::fstat(src_fd.get(), &sb) == -1) {
        return std::unexpected(infra::make_system_error(
            last_error(), fmt::format("fstat failed for {}", src.string())));
    }
    const auto size = static_cast<std::size_t>(sb.st_size);
    if (size == 0) {
        // mmap нулевой длины недопустим
        return copy_file_buffered(src, dst);
    }

    void* src_map = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, src_fd.get(), 0);
    if (src_map == MAP_FAILED) {
        return std::unexpected(infra::make_system_error(
            last_error(), fmt::format("mmap failed for {}", src.string())));
    }
    ::madvise(src_map, size, MADV_SEQUENTIAL);

    ScopedFd dst_fd;
    auto opened = open_destination(dst, dst_fd);
    if (!opened) {
        ::munmap(src_map, size);
        return opened;
    }

    auto ec = write_all(dst_fd.get(), static_cast<const char*>(src_map), size);
    ::munmap(src_map, size);
    if (ec) {
        return std::unexpected(infra::make_system_error(
            ec, fmt::format("Incomplete write in mmap copy to {}", dst.string())));
    }

    return finish_destination(dst_fd, dst);
}

// =============== Unified copy_file ===============
auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy
) -> infra::VoidResult {
    auto res = strategy == CopyStrategy::MMap
        ? copy_file_mmap(src, dst)
        : copy_file_buffered(src, dst);

    if (!res) {
        // Не оставляем наполовину записанный файл
        std::error_code ec;
        if (std::filesystem::is_regular_file(std::filesystem::symlink_status(dst, ec))) {
            std::filesystem::remove(dst, ec);
        }
    }
    return res;
}

auto copy_symlink(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult {
    std::error_code ec;
    const auto target = std::filesystem::read_symlink(src, ec);
    if (ec) {
        return std::unexpected(infra::make_system_error(
            ec, fmt::format("Cannot read link {}", src.string())));
    }

    std::filesystem::create_symlink(target, dst, ec);
    if (ec) {
        return std::unexpected(infra::make_system_error(
            ec, fmt::format("Cannot create link {}", dst.string())));
    }
    return {};
}

} // namespace mtcopy::adapters::fs
