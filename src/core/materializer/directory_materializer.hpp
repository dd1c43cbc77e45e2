#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include "../../infra/error_handler/error.hpp"

namespace mtcopy::core {

/// Создаёт каталоги назначения (вместе с недостающими предками).
///
/// Идемпотентен и безопасен при одновременных вызовах для одних и тех же или
/// пересекающихся путей. Реестр уже созданных каталогов только экономит
/// системные вызовы: корректность обеспечивает сама процедура создания.
class DirectoryMaterializer {
public:
    explicit DirectoryMaterializer(std::filesystem::path destination_root);

    DirectoryMaterializer(const DirectoryMaterializer&) = delete;
    DirectoryMaterializer& operator=(const DirectoryMaterializer&) = delete;

    // relative_dir пустой => корень назначения
    [[nodiscard]] auto ensure(const std::filesystem::path& relative_dir) -> infra::VoidResult;

    [[nodiscard]] auto destination_root() const -> const std::filesystem::path& { return root_; }

    // Для диагностики и тестов
    [[nodiscard]] auto ledger_size() const -> std::size_t;
    [[nodiscard]] auto directories_created() const -> std::size_t {
        return created_.load(std::memory_order_relaxed);
    }

private:
    [[nodiscard]] bool in_ledger(const std::string& key) const;
    void remember(const std::filesystem::path& relative_dir);
    [[nodiscard]] auto create_one(const std::filesystem::path& absolute) -> std::error_code;

    const std::filesystem::path root_;
    mutable std::shared_mutex ledger_mutex_;
    std::unordered_set<std::string> ledger_;
    std::atomic<std::size_t> created_{0};
};

} // namespace mtcopy::core
