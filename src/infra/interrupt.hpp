#pragma once

#include <atomic>
#include <csignal>
#include <stop_token>
#include <thread>

namespace mtcopy::infra {

// Устанавливается только обработчиком сигналов
extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

/// Поток-наблюдатель: при получении SIGINT/SIGTERM вызывает
/// source.request_stop(). Завершается вместе с jthread (request_stop + join).
[[nodiscard]] auto watch_interrupts(std::stop_source source) -> std::jthread;

} // namespace mtcopy::infra
