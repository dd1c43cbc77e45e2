// extensions/metadata.hpp
#pragma once

#include <filesystem>
#include "../infra/error_handler/error.hpp"

namespace mtcopy::extensions {

/// Переносит права доступа и времена (atime, mtime) с src на dst.
/// Ссылки не разыменовываются: для символической ссылки переносятся
/// только времена самой ссылки.
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> infra::VoidResult;

} // namespace mtcopy::extensions
