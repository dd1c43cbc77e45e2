#include "tree_enumerator.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace mtcopy::core {

namespace fs = std::filesystem;

TreeEnumerator::TreeEnumerator(fs::path root, std::vector<std::regex> excludes)
    : root_(std::move(root))
    , excludes_(std::move(excludes))
{}

auto TreeEnumerator::open(const fs::path& root,
                          const std::vector<std::string>& exclude_patterns)
    -> infra::Result<TreeEnumerator>
{
    std::vector<std::regex> excludes;
    excludes.reserve(exclude_patterns.size());
    for (const auto& pattern : exclude_patterns) {
        try {
            excludes.emplace_back(pattern);
        } catch (const std::regex_error& e) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                fmt::format("Invalid exclude pattern '{}': {}", pattern, e.what())));
        }
    }

    std::error_code ec;
    const auto status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return std::unexpected(infra::make_system_error(
                ec, fmt::format("Cannot access source {}", root.string())));
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
            fmt::format("Source does not exist: {}", root.string())));
    }
    if (!fs::is_directory(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotADirectory,
            fmt::format("Source is not a directory: {}", root.string())));
    }

    fs::directory_iterator it(root, ec);
    if (ec) {
        auto error = infra::make_system_error(ec, fmt::format("Cannot read source {}", root.string()));
        if (error.code == infra::ErrorCode::IOError || error.code == infra::ErrorCode::Busy) {
            error.code = infra::ErrorCode::PermissionDenied;
        }
        return std::unexpected(std::move(error));
    }

    TreeEnumerator enumerator(root, std::move(excludes));
    enumerator.stack_.push_back(Frame{std::move(it), fs::path{}});
    return enumerator;
}

bool TreeEnumerator::is_excluded(const fs::path& name) const {
    const auto filename = name.string();
    for (const auto& re : excludes_) {
        if (std::regex_match(filename, re)) {
            return true;
        }
    }
    return false;
}

void TreeEnumerator::warn(const fs::path& relative, infra::Error error) {
    spdlog::warn("Skipping {}: {}", relative.empty() ? std::string(".") : relative.string(), error.message);
    warnings_.push_back(EnumerationWarning{relative, std::move(error)});
}

bool TreeEnumerator::push_directory(const fs::path& relative) {
    std::error_code ec;
    fs::directory_iterator it(root_ / relative, ec);
    if (ec) {
        warn(relative, infra::make_system_error(ec, fmt::format("Cannot read directory {}", relative.string())));
        return false;
    }
    stack_.push_back(Frame{std::move(it), relative});
    return true;
}

auto TreeEnumerator::next() -> std::optional<Entry> {
    while (!stack_.empty()) {
        auto& frame = stack_.back();
        if (frame.it == fs::directory_iterator{}) {
            stack_.pop_back();
            continue;
        }

        const fs::directory_entry dir_entry = *frame.it;
        const fs::path relative = frame.relative / dir_entry.path().filename();

        // Сдвигаемся до push_directory: frame станет недействительным
        std::error_code ec;
        frame.it.increment(ec);
        if (ec) {
            warn(frame.relative, infra::make_system_error(
                ec, fmt::format("Error while listing {}", frame.relative.string())));
            stack_.pop_back();
        }

        if (is_excluded(relative.filename())) {
            spdlog::debug("Excluded: {}", relative.string());
            continue;
        }

        const auto status = dir_entry.symlink_status(ec);
        if (ec) {
            // Запись исчезла между чтением каталога и stat
            warn(relative, infra::make_system_error(ec, fmt::format("Cannot stat {}", relative.string())));
            continue;
        }

        if (fs::is_symlink(status)) {
            return Entry{relative, EntryKind::Symlink, 0};
        }
        if (fs::is_directory(status)) {
            if (!push_directory(relative)) {
                continue; // поддерево пропущено
            }
            return Entry{relative, EntryKind::Directory, 0};
        }
        if (fs::is_regular_file(status)) {
            const auto size = dir_entry.file_size(ec);
            if (ec) {
                warn(relative, infra::make_system_error(ec, fmt::format("Cannot stat {}", relative.string())));
                continue;
            }
            return Entry{relative, EntryKind::RegularFile, static_cast<std::uint64_t>(size)};
        }
        return Entry{relative, EntryKind::Other, 0};
    }
    return std::nullopt;
}

} // namespace mtcopy::core
