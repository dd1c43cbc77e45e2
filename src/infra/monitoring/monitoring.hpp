#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>

#include "progress_state.hpp"

namespace mtcopy::infra {

/// Периодически перерисовывает строку прогресса по снимкам ProgressState.
/// Только читает общее состояние.
class ProgressMonitor {
public:
    struct Options {
        bool enabled = true;
        std::chrono::milliseconds refresh_interval{100};
        int bar_width = 30;
        std::FILE* out = stdout;
    };

    ProgressMonitor(const ProgressState& state, Options options);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    // Останавливает поток отрисовки и выводит финальную строку (однократно)
    void finish();

    [[nodiscard]] auto is_enabled() const -> bool { return options_.enabled; }

    // elapsed * (bytes_total - bytes_done) / max(bytes_done, 1)
    [[nodiscard]] static auto estimate_remaining(const ProgressSnapshot& stats,
                                                 std::chrono::steady_clock::time_point now)
        -> std::chrono::duration<double>;

    // Доля выполненного по файлам. Пока обход не закончен, total ещё растёт,
    // поэтому доля не доходит до 1.0.
    [[nodiscard]] static auto completed_fraction(const ProgressSnapshot& stats) -> double;

    // min_fraction: нижняя граница для полосы и процента
    [[nodiscard]] static auto format_line(const ProgressSnapshot& stats,
                                          std::chrono::steady_clock::time_point now,
                                          int bar_width,
                                          double min_fraction = 0.0) -> std::string;

    // Следующая строка для вывода; полоса никогда не откатывается назад
    [[nodiscard]] auto next_line(const ProgressSnapshot& stats,
                                 std::chrono::steady_clock::time_point now) -> std::string;

    // 75 -> "01:15", 3700 -> "01:01:40"
    [[nodiscard]] static auto format_duration(std::chrono::duration<double> d) -> std::string;

    // 1536 -> "1.5 KB"
    [[nodiscard]] static auto format_bytes(double bytes) -> std::string;

private:
    void render_();
    void start_rendering_thread_();
    void stop_rendering_thread_();

    const ProgressState& state_;
    const Options options_;
    bool finished_ = false;
    double shown_fraction_ = 0.0; // пишет только поток отрисовки, потом finish()
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace mtcopy::infra
