#include "xxhash_verifier.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cerrno>
#include <memory>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace mtcopy::infra {

namespace {

struct StateDeleter {
    void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
};

struct FdCloser {
    int fd;
    ~FdCloser() { if (fd >= 0) ::close(fd); }
};

auto errno_code() -> std::error_code {
    return {errno, std::system_category()};
}

} // namespace

auto XXHashVerifier::hash_file(const std::filesystem::path& path)
    -> Result<XXH64_hash_t>
{
    const FdCloser file{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};
    if (file.fd < 0) {
        return std::unexpected(make_system_error(
            errno_code(), fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    std::unique_ptr<XXH64_state_t, StateDeleter> state(XXH64_createState());
    if (!state) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH64 state"));
    }
    XXH64_reset(state.get(), 0);

    std::vector<char> buffer(BUFFER_SIZE);
    for (;;) {
        const ssize_t n = ::read(file.fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(make_system_error(
                errno_code(), fmt::format("Error reading file: {}", path.string())));
        }
        if (n == 0) break;
        XXH64_update(state.get(), buffer.data(), static_cast<size_t>(n));
    }

    return XXH64_digest(state.get());
}

auto XXHashVerifier::verify_files(const std::filesystem::path& src,
                                  const std::filesystem::path& dst)
    -> Result<bool>
{
    std::error_code src_ec, dst_ec;
    const auto src_size = std::filesystem::file_size(src, src_ec);
    const auto dst_size = std::filesystem::file_size(dst, dst_ec);
    if (!src_ec && !dst_ec && src_size != dst_size) {
        spdlog::warn("Size mismatch: {} ({} bytes) vs {} ({} bytes)",
                     src.string(), src_size, dst.string(), dst_size);
        return false;
    }

    auto src_hash = hash_file(src);
    if (!src_hash) {
        return std::unexpected(std::move(src_hash.error()));
    }

    auto dst_hash = hash_file(dst);
    if (!dst_hash) {
        return std::unexpected(std::move(dst_hash.error()));
    }

    if (*src_hash != *dst_hash) {
        spdlog::warn("Hash mismatch: {} (src: {:016x}) vs {} (dst: {:016x})",
                     src.string(), *src_hash,
                     dst.string(), *dst_hash);
        return false;
    }
    return true;
}

auto XXHashVerifier::verify_copy(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> VoidResult
{
    auto match = verify_files(src, dst);
    if (!match) {
        return std::unexpected(std::move(match.error()));
    }
    if (!*match) {
        return std::unexpected(make_error(ErrorCode::ChecksumMismatch,
            fmt::format("Copy of {} does not match the source", src.string())));
    }
    return {};
}

} // namespace mtcopy::infra
