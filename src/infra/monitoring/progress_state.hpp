#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace mtcopy::infra {

// Согласованный снимок счётчиков для отрисовки
struct ProgressSnapshot {
    std::uint64_t files_total = 0;
    std::uint64_t files_done = 0;
    std::uint64_t files_failed = 0;
    std::uint64_t bytes_total = 0;
    std::uint64_t bytes_done = 0;
    bool enumeration_complete = false;
    std::chrono::steady_clock::time_point started_at{};
};

/// Общие счётчики прогресса одного запуска.
///
/// Писатели: поток обхода (record_enumerated) и рабочие потоки
/// (record_completed / record_failed). Читатель: ProgressMonitor.
/// Все операции неблокирующие; счётчики только растут.
class ProgressState {
public:
    ProgressState();

    // Запрещаем копирование и перемещение (из-за atomic)
    ProgressState(const ProgressState&) = delete;
    ProgressState& operator=(const ProgressState&) = delete;

    void record_enumerated(bool is_file, std::uint64_t size_bytes);
    void record_completed(std::uint64_t size_bytes);
    // Файл обработан неуспешно: учитывается в done, чтобы прогресс дошёл до 100%
    void record_failed(std::uint64_t size_bytes);
    void mark_enumeration_complete();

    [[nodiscard]] auto snapshot() const -> ProgressSnapshot;
    [[nodiscard]] auto started_at() const -> std::chrono::steady_clock::time_point { return started_at_; }

private:
    std::atomic<std::uint64_t> files_total_{0};
    std::atomic<std::uint64_t> files_done_{0};
    std::atomic<std::uint64_t> files_failed_{0};
    std::atomic<std::uint64_t> bytes_total_{0};
    std::atomic<std::uint64_t> bytes_done_{0};
    std::atomic<bool> enumeration_complete_{false};
    const std::chrono::steady_clock::time_point started_at_;
};

} // namespace mtcopy::infra
