// metadata.cpp
#include "metadata.hpp"
#include <cerrno>
#include <fmt/core.h>

#include <fcntl.h>
#include <sys/stat.h>

namespace mtcopy::extensions {

namespace {

auto errno_error(std::string_view what, const std::filesystem::path& path) -> infra::Error {
    return infra::make_system_error(std::error_code(errno, std::system_category()),
                                    fmt::format("Metadata copy failed: {} {}", what, path.string()));
}

} // namespace

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> infra::VoidResult
{
    struct stat st;
    if (::lstat(src.c_str(), &st) != 0) {
        return std::unexpected(errno_error("cannot stat", src));
    }

    // Права у ссылки в Linux не меняются
    if (!S_ISLNK(st.st_mode) && ::chmod(dst.c_str(), st.st_mode & 07777) != 0) {
        return std::unexpected(errno_error("cannot set permissions on", dst));
    }

    const struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (::utimensat(AT_FDCWD, dst.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        return std::unexpected(errno_error("cannot set times on", dst));
    }

    return {};
}

} // namespace mtcopy::extensions
