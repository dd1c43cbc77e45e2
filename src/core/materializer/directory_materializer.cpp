#include "directory_materializer.hpp"

#include <cerrno>
#include <mutex>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>

namespace mtcopy::core {

namespace fs = std::filesystem;

DirectoryMaterializer::DirectoryMaterializer(fs::path destination_root)
    : root_(std::move(destination_root))
{}

bool DirectoryMaterializer::in_ledger(const std::string& key) const {
    std::shared_lock lock(ledger_mutex_);
    return ledger_.contains(key);
}

void DirectoryMaterializer::remember(const fs::path& relative_dir) {
    std::unique_lock lock(ledger_mutex_);
    // Предки тоже существуют
    for (auto p = relative_dir; !p.empty(); p = p.parent_path()) {
        if (!ledger_.insert(p.string()).second) break;
    }
}

auto DirectoryMaterializer::ledger_size() const -> std::size_t {
    std::shared_lock lock(ledger_mutex_);
    return ledger_.size();
}

// mkdir одного уровня; EEXIST поверх каталога считается успехом
auto DirectoryMaterializer::create_one(const fs::path& absolute) -> std::error_code {
    if (::mkdir(absolute.c_str(), 0755) == 0) {
        created_.fetch_add(1, std::memory_order_relaxed);
        spdlog::trace("Created directory {}", absolute.string());
        return {};
    }

    const std::error_code mkdir_ec(errno, std::system_category());
    if (mkdir_ec.value() == EEXIST) {
        std::error_code ec;
        if (fs::is_directory(absolute, ec)) {
            return {}; // создан другим потоком или существовал
        }
        return std::make_error_code(std::errc::not_a_directory);
    }
    return mkdir_ec;
}

auto DirectoryMaterializer::ensure(const fs::path& relative_dir) -> infra::VoidResult {
    const auto key = relative_dir.lexically_normal().string();
    if (key.empty() || key == ".") {
        if (fs::is_directory(root_)) return {};
    } else if (in_ledger(key)) {
        return {};
    }

    // Собираем отсутствующие уровни снизу вверх
    const auto target = (key.empty() || key == ".") ? root_ : root_ / relative_dir;
    std::vector<fs::path> missing;
    std::error_code ec;
    for (auto p = target; !p.empty(); p = p.parent_path()) {
        const auto status = fs::status(p, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return std::unexpected(infra::make_system_error(
                ec, fmt::format("Cannot access {}", p.string())));
        }
        if (fs::is_directory(status)) break;
        if (fs::exists(status)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::NotADirectory,
                fmt::format("Cannot create directory {}: a non-directory is in the way at {}",
                            target.string(), p.string())));
        }
        missing.push_back(p);
        if (p == p.parent_path()) break;
    }

    // ...и создаём сверху вниз
    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        if (auto err = create_one(*it); err) {
            return std::unexpected(infra::make_system_error(
                err, fmt::format("Cannot create directory {}", it->string())));
        }
    }

    if (!key.empty() && key != ".") {
        remember(relative_dir.lexically_normal());
    }
    return {};
}

} // namespace mtcopy::core
