#pragma once

#include <filesystem>
#include <expected>
#include <cstdint>
#include "infra/error_handler/error.hpp"

namespace mtcopy::adapters::fs {

enum class CopyStrategy {
    Buffered,    // < 1 MB
    MMap,        // >= 1 MB
};

[[nodiscard]] auto select_strategy(std::uintmax_t file_size) -> CopyStrategy;

/// Копирует содержимое src в dst (dst создаётся или усекается).
/// При ошибке частично записанный dst удаляется.
[[nodiscard]] auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy = CopyStrategy::Buffered
) -> infra::VoidResult;

[[nodiscard]] auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

[[nodiscard]] auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

/// Воссоздаёт символическую ссылку src в dst с той же целью (без разыменования).
[[nodiscard]] auto copy_symlink(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

} // namespace mtcopy::adapters::fs
