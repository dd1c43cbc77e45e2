#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <expected>
#include <atomic>
#include <memory>
#include <mutex>
#include <stop_token>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/progress_state.hpp"
#include "../../infra/work_queue/bounded_queue.hpp"
#include "../enumerator/tree_enumerator.hpp"
#include "../materializer/directory_materializer.hpp"
#include "../report/run_report.hpp"

namespace mtcopy::core {

// Одна задача = один обычный файл
struct CopyTask {
    std::filesystem::path relative_path;
    std::uint64_t size_bytes = 0;
};

enum class CopyOutcome {
    Copied,
    Skipped,    // запись в назначении уже есть, on_conflict=skip
};

struct CopyStats {
    std::atomic<std::uint64_t> files_copied{0};
    std::atomic<std::uint64_t> bytes_copied{0};
    std::atomic<std::uint64_t> files_skipped{0};
    std::atomic<std::uint64_t> links_copied{0};
    std::atomic<std::uint64_t> links_skipped{0};
    std::atomic<std::uint64_t> entries_ignored{0};
    std::atomic<std::uint64_t> directories{0};

    // Конструктор по умолчанию
    CopyStats() = default;

    // Запрещаем копирование и перемещение (из-за atomic)
    CopyStats(const CopyStats&) = delete;
    CopyStats& operator=(const CopyStats&) = delete;
    CopyStats(CopyStats&&) = delete;
    CopyStats& operator=(CopyStats&&) = delete;
};

/// Копирует дерево source в destination пулом из config.threads потоков.
///
/// Обход идёт в вызывающем потоке и наполняет ограниченную очередь задач,
/// рабочие потоки разбирают её параллельно. Прогресс пишется в переданный
/// ProgressState. Один объект CopyEngine обслуживает один запуск.
class CopyEngine {
public:
    explicit CopyEngine(const infra::Config& config,
                        infra::ProgressState& progress);

    /// Ошибка возвращается только для ошибок настройки (до начала копирования).
    /// Ошибки отдельных файлов попадают в RunReport::failures.
    [[nodiscard]] auto run(const std::filesystem::path& source,
                           const std::filesystem::path& destination,
                           std::stop_token stop = {})
        -> infra::Result<RunReport>;

private:
    using TaskQueue = infra::BoundedQueue<CopyTask>;

    [[nodiscard]] auto validate_setup(const std::filesystem::path& source,
                                      const std::filesystem::path& destination) const
        -> infra::VoidResult;

    void produce(TreeEnumerator& enumerator, TaskQueue& queue, std::stop_token stop);
    void worker_loop(TaskQueue& queue, std::stop_token stop);
    void process_task(const CopyTask& task);

    [[nodiscard]] auto copy_file(const CopyTask& task) -> infra::Result<CopyOutcome>;
    [[nodiscard]] auto copy_link(const std::filesystem::path& relative) -> infra::Result<CopyOutcome>;
    // Применяет on_conflict к существующему dst; true - файл нужно пропустить
    [[nodiscard]] auto resolve_conflict(const std::filesystem::path& dst) -> infra::Result<bool>;
    void preserve_metadata(const std::filesystem::path& src,
                           const std::filesystem::path& dst,
                           const std::filesystem::path& relative) const;

    void add_failure(const std::filesystem::path& relative, infra::Error&& error);

    const infra::Config& config_;
    infra::ProgressState& progress_;

    std::filesystem::path source_;
    std::filesystem::path destination_;
    std::unique_ptr<DirectoryMaterializer> materializer_;
    bool started_ = false;

    // Статистика
    CopyStats stats_{};
    std::mutex failures_mutex_;
    std::vector<TaskFailure> failures_;
};

} // namespace mtcopy::core
