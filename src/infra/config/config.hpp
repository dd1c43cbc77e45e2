#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>

namespace mtcopy::args_parser {
    struct CLIArgs;
}

namespace mtcopy::infra {

// Что делать с символическими ссылками в исходном дереве
enum class SymlinkPolicy {
    Copy,   // воссоздать ссылку как ссылку (цель не разыменовывается)
    Skip,
};

// Что делать, если файл назначения уже существует
enum class ConflictPolicy {
    Overwrite,
    Skip,
    Error,
};

[[nodiscard]] auto parse_symlink_policy(std::string_view value) -> std::optional<SymlinkPolicy>;
[[nodiscard]] auto parse_conflict_policy(std::string_view value) -> std::optional<ConflictPolicy>;
[[nodiscard]] auto to_string(SymlinkPolicy policy) -> std::string_view;
[[nodiscard]] auto to_string(ConflictPolicy policy) -> std::string_view;

struct Config {
    // I/O
    std::optional<std::uint32_t> threads;
    std::optional<std::size_t> queue_capacity;
    std::optional<std::uint32_t> refresh_ms;
    std::optional<std::uint32_t> retry_attempts;

    // Behavior
    std::optional<SymlinkPolicy> symlinks;
    std::optional<ConflictPolicy> on_conflict;
    bool verify = false;
    bool preserve_metadata = true;
    bool progress = true;
    bool quiet = false;
    std::optional<std::string> log_level;

    // Paths
    std::vector<std::string> exclude_patterns;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    // Значения по умолчанию для незаданных полей
    [[nodiscard]] auto queue_capacity_or_default() const -> std::size_t { return queue_capacity.value_or(1024); }
    [[nodiscard]] auto refresh_interval_or_default() const -> std::uint32_t { return refresh_ms.value_or(100); }
    [[nodiscard]] auto retry_attempts_or_default() const -> std::uint32_t { return retry_attempts.value_or(3); }
    [[nodiscard]] auto symlinks_or_default() const -> SymlinkPolicy { return symlinks.value_or(SymlinkPolicy::Copy); }
    [[nodiscard]] auto on_conflict_or_default() const -> ConflictPolicy { return on_conflict.value_or(ConflictPolicy::Overwrite); }
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.mtcopy.yaml
///   2. $XDG_CONFIG_HOME/mtcopy/config.yaml
///   3. ~/.config/mtcopy/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Разбор конкретного файла (ошибка, если файла нет или он некорректен).
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const mtcopy::args_parser::CLIArgs& args) -> Config;

} // namespace mtcopy::infra
