#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>

namespace mtcopy::infra {

namespace {

constexpr double kMaxProvisionalFraction = 0.99;

} // namespace

ProgressMonitor::ProgressMonitor(const ProgressState& state, Options options)
    : state_(state)
    , options_(options)
{
    if (options_.enabled) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    finish();
}

void ProgressMonitor::finish() {
    if (finished_) return;
    finished_ = true;

    stop_rendering_thread_();
    if (options_.enabled) {
        render_();
        fmt::print(options_.out, "\n"); // финальный перенос
        std::fflush(options_.out);
    }
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock lock(m);
        while (!st.stop_requested()) {
            render_();
            // Ждём интервал, но просыпаемся сразу при остановке
            cv.wait_for(lock, st, options_.refresh_interval, [] { return false; });
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_->join();
        render_thread_.reset();
    }
}

auto ProgressMonitor::next_line(const ProgressSnapshot& stats,
                                std::chrono::steady_clock::time_point now) -> std::string
{
    shown_fraction_ = std::max(shown_fraction_, completed_fraction(stats));
    return format_line(stats, now, options_.bar_width, shown_fraction_);
}

void ProgressMonitor::render_() {
    const auto line = next_line(state_.snapshot(), std::chrono::steady_clock::now());
    // ANSI: очистить строку
    fmt::print(options_.out, "\r\033[K{}", line);
    std::fflush(options_.out);
}

auto ProgressMonitor::estimate_remaining(const ProgressSnapshot& stats,
                                         std::chrono::steady_clock::time_point now)
    -> std::chrono::duration<double>
{
    const double elapsed = std::chrono::duration<double>(now - stats.started_at).count();
    if (elapsed <= 0.0 || stats.bytes_done >= stats.bytes_total) {
        return std::chrono::duration<double>(0.0);
    }
    const double remaining = static_cast<double>(stats.bytes_total - stats.bytes_done);
    const double done = static_cast<double>(std::max<std::uint64_t>(stats.bytes_done, 1));
    return std::chrono::duration<double>(elapsed * remaining / done);
}

auto ProgressMonitor::format_duration(std::chrono::duration<double> d) -> std::string {
    if (!std::isfinite(d.count()) || d.count() < 0) {
        return "--:--";
    }
    auto total = static_cast<std::uint64_t>(d.count());
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;
    if (hours > 0) {
        return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
    }
    return fmt::format("{:02d}:{:02d}", minutes, seconds);
}

auto ProgressMonitor::format_bytes(double bytes) -> std::string {
    const char* unit = "B";
    if (bytes >= 1024.0 * 1024 * 1024) { bytes /= 1024.0 * 1024 * 1024; unit = "GB"; }
    else if (bytes >= 1024.0 * 1024) { bytes /= 1024.0 * 1024; unit = "MB"; }
    else if (bytes >= 1024.0) { bytes /= 1024.0; unit = "KB"; }
    else { return fmt::format("{:.0f} B", bytes); }
    return fmt::format("{:.1f} {}", bytes, unit);
}

auto ProgressMonitor::completed_fraction(const ProgressSnapshot& stats) -> double {
    // Пустое дерево после обхода считается завершённым
    double fraction = 0.0;
    if (stats.files_total > 0) {
        fraction = static_cast<double>(stats.files_done) / static_cast<double>(stats.files_total);
    } else if (stats.enumeration_complete) {
        fraction = 1.0;
    }
    if (!stats.enumeration_complete) {
        fraction = std::min(fraction, kMaxProvisionalFraction);
    }
    return std::clamp(fraction, 0.0, 1.0);
}

auto ProgressMonitor::format_line(const ProgressSnapshot& stats,
                                  std::chrono::steady_clock::time_point now,
                                  int bar_width,
                                  double min_fraction) -> std::string
{
    const double fraction = std::clamp(std::max(completed_fraction(stats), min_fraction), 0.0, 1.0);

    const int width = std::max(bar_width, 1);
    const int filled = static_cast<int>(fraction * width);
    std::string bar(static_cast<std::size_t>(filled), '#');
    if (filled < width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(width - filled - 1), '-');
    }

    const auto elapsed = std::chrono::duration<double>(now - stats.started_at);
    const double elapsed_sec = elapsed.count();
    const double bytes_per_sec = elapsed_sec > 0 ? stats.bytes_done / elapsed_sec : 0.0;

    // Пока ничего не скопировано, оценка бессмысленна
    std::string eta_str = "--:--";
    if (stats.bytes_done > 0 || (stats.enumeration_complete && stats.bytes_total == 0)) {
        eta_str = format_duration(estimate_remaining(stats, now));
    }
    if (!stats.enumeration_complete) {
        eta_str = "~" + eta_str; // предварительная оценка
    }

    std::string line = fmt::format(
        "[{}] {:5.1f}% | {}/{} files | {}/s | elapsed {} | ETA {}",
        bar,
        fraction * 100.0,
        stats.files_done,
        stats.files_total,
        format_bytes(bytes_per_sec),
        format_duration(elapsed),
        eta_str
    );
    if (stats.files_failed > 0) {
        line += fmt::format(" | {} failed", stats.files_failed);
    }
    return line;
}

} // namespace mtcopy::infra
