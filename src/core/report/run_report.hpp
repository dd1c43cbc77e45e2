#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>
#include "../../infra/error_handler/error.hpp"
#include "../enumerator/tree_enumerator.hpp"

namespace mtcopy::core {

// Файл (или ссылка), который не удалось скопировать
struct TaskFailure {
    std::filesystem::path relative_path;
    infra::Error error;
};

struct RunReport {
    std::uint64_t files_total = 0;
    std::uint64_t files_copied = 0;
    std::uint64_t files_skipped = 0;     // уже существовали (on_conflict=skip)
    std::uint64_t files_failed = 0;      // только обычные файлы
    std::uint64_t links_copied = 0;
    std::uint64_t links_skipped = 0;     // уже существовали (on_conflict=skip)
    std::uint64_t entries_ignored = 0;   // ссылки при symlinks=skip, fifo, сокеты, устройства
    std::uint64_t directories = 0;
    std::uint64_t bytes_total = 0;
    std::uint64_t bytes_copied = 0;
    std::chrono::milliseconds elapsed{0};
    bool interrupted = false;

    std::vector<TaskFailure> failures;
    std::vector<EnumerationWarning> warnings;

    // Всё скопировано, ничего не пропущено из-за ошибок
    [[nodiscard]] auto ok() const -> bool {
        return !interrupted && failures.empty() && warnings.empty();
    }
};

/// 0 - успех, 2 - часть файлов не скопирована, 130 - прервано.
[[nodiscard]] auto exit_code(const RunReport& report) -> int;

[[nodiscard]] auto format_summary(const RunReport& report) -> std::string;

void print_summary(const RunReport& report, std::FILE* out = stdout);

} // namespace mtcopy::core
