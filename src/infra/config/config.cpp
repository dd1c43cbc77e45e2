#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <unistd.h>
#include <pwd.h>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace mtcopy::infra {

    auto parse_symlink_policy(std::string_view value) -> std::optional<SymlinkPolicy> {
        if (value == "copy") return SymlinkPolicy::Copy;
        if (value == "skip") return SymlinkPolicy::Skip;
        return std::nullopt;
    }

    auto parse_conflict_policy(std::string_view value) -> std::optional<ConflictPolicy> {
        if (value == "overwrite") return ConflictPolicy::Overwrite;
        if (value == "skip") return ConflictPolicy::Skip;
        if (value == "error") return ConflictPolicy::Error;
        return std::nullopt;
    }

    auto to_string(SymlinkPolicy policy) -> std::string_view {
        return policy == SymlinkPolicy::Copy ? "copy" : "skip";
    }

    auto to_string(ConflictPolicy policy) -> std::string_view {
        switch (policy) {
            case ConflictPolicy::Overwrite: return "overwrite";
            case ConflictPolicy::Skip:      return "skip";
            case ConflictPolicy::Error:     return "error";
        }
        return "overwrite";
    }

    void Config::merge_with(const Config& other) {
        if (other.threads) threads = other.threads;
        if (other.queue_capacity) queue_capacity = other.queue_capacity;
        if (other.refresh_ms) refresh_ms = other.refresh_ms;
        if (other.retry_attempts) retry_attempts = other.retry_attempts;
        if (other.symlinks) symlinks = other.symlinks;
        if (other.on_conflict) on_conflict = other.on_conflict;
        if (other.log_level) log_level = other.log_level;
        if (other.verify) verify = true;
        if (!other.preserve_metadata) preserve_metadata = false; // CLI может отключить
        if (!other.progress) progress = false;
        if (other.quiet) quiet = true;

        if (!other.exclude_patterns.empty()) exclude_patterns = other.exclude_patterns;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".mtcopy.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "mtcopy" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (!home) {
                if (const passwd* pw = ::getpwuid(::getuid())) {
                    home = pw->pw_dir;
                }
            }
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "mtcopy" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config_from_path(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["queue_capacity"]) cfg.queue_capacity = config["queue_capacity"].as<std::size_t>();
            if (config["refresh_ms"]) cfg.refresh_ms = config["refresh_ms"].as<std::uint32_t>();
            if (config["retry_attempts"]) cfg.retry_attempts = config["retry_attempts"].as<std::uint32_t>();

            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["preserve_metadata"]) cfg.preserve_metadata = config["preserve_metadata"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            if (config["symlinks"]) {
                const auto value = config["symlinks"].as<std::string>();
                cfg.symlinks = parse_symlink_policy(value);
                if (!cfg.symlinks) {
                    return std::unexpected(fmt::format("{}: invalid symlinks policy '{}'", path.string(), value));
                }
            }
            if (config["on_conflict"]) {
                const auto value = config["on_conflict"].as<std::string>();
                cfg.on_conflict = parse_conflict_policy(value);
                if (!cfg.on_conflict) {
                    return std::unexpected(fmt::format("{}: invalid on_conflict policy '{}'", path.string(), value));
                }
            }

            if (config["exclude"]) {
                for (const auto& pat : config["exclude"]) {
                    cfg.exclude_patterns.push_back(pat.as<std::string>());
                }
            }

            if (cfg.queue_capacity && *cfg.queue_capacity == 0) {
                return std::unexpected(fmt::format("{}: queue_capacity must be positive", path.string()));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return load_config_from_path(path);
        }

        // Файл не найден: пустой конфиг, это не ошибка
        return Config{};
    }

    auto config_from_cli(const mtcopy::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.threads = args.threads;
        cfg.queue_capacity = args.queue_capacity;
        cfg.verify = args.verify;
        cfg.preserve_metadata = args.preserve_metadata;
        cfg.progress = args.progress;
        cfg.quiet = args.quiet;
        cfg.log_level = args.log_level;
        cfg.exclude_patterns = args.exclude_patterns;
        if (args.symlinks) cfg.symlinks = parse_symlink_policy(*args.symlinks);
        if (args.on_conflict) cfg.on_conflict = parse_conflict_policy(*args.on_conflict);
        return cfg;
    }

} // namespace mtcopy::infra
