#pragma once

#include <filesystem>
#include <expected>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace mtcopy::infra {

/// Проверка копии по xxHash64 (--verify).
class XXHashVerifier {
public:
    // xxHash64 содержимого файла, seed = 0
    static auto hash_file(const std::filesystem::path& path)
        -> Result<XXH64_hash_t>;

    // true, если содержимое совпадает. Разный размер - false без чтения.
    static auto verify_files(const std::filesystem::path& src,
                             const std::filesystem::path& dst)
        -> Result<bool>;

    // Как verify_files, но несовпадение - ошибка ChecksumMismatch
    static auto verify_copy(const std::filesystem::path& src,
                            const std::filesystem::path& dst)
        -> VoidResult;

private:
    static constexpr size_t BUFFER_SIZE = 1024 * 1024; // 1MB buffer
};

} // namespace mtcopy::infra
