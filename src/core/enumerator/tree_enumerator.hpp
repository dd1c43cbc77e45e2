#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace mtcopy::core {

enum class EntryKind {
    Directory,
    RegularFile,
    Symlink,
    Other,      // fifo, сокет, устройство
};

struct Entry {
    std::filesystem::path relative_path;
    EntryKind kind = EntryKind::Other;
    std::uint64_t size_bytes = 0;   // только для RegularFile
};

// Поддерево, которое не удалось прочитать (пропущено)
struct EnumerationWarning {
    std::filesystem::path relative_path;
    infra::Error error;
};

/// Ленивый обход дерева в глубину (pre-order: каталог раньше содержимого).
/// Символические ссылки не разыменовываются. Одноразовый: после того как
/// next() вернул std::nullopt, обход закончен.
class TreeEnumerator {
public:
    /// Ошибки: NotFound, NotADirectory, PermissionDenied (корень не читается),
    /// InvalidArgument (некорректный шаблон исключения).
    [[nodiscard]] static auto open(const std::filesystem::path& root,
                                   const std::vector<std::string>& exclude_patterns = {})
        -> infra::Result<TreeEnumerator>;

    [[nodiscard]] auto next() -> std::optional<Entry>;

    [[nodiscard]] auto warnings() const -> const std::vector<EnumerationWarning>& { return warnings_; }
    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    struct Frame {
        std::filesystem::directory_iterator it;
        std::filesystem::path relative;
    };

    TreeEnumerator(std::filesystem::path root, std::vector<std::regex> excludes);

    [[nodiscard]] bool is_excluded(const std::filesystem::path& name) const;
    bool push_directory(const std::filesystem::path& relative);
    void warn(const std::filesystem::path& relative, infra::Error error);

    std::filesystem::path root_;
    std::vector<std::regex> excludes_;
    std::vector<Frame> stack_;
    std::vector<EnumerationWarning> warnings_;
};

} // namespace mtcopy::core
