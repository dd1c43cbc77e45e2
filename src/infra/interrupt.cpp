#include "interrupt.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace mtcopy::infra {

std::atomic<bool> g_interrupted{false};

namespace {

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

std::jthread watch_interrupts(std::stop_source source) {
    return std::jthread([source](std::stop_token st) mutable {
        while (!st.stop_requested()) {
            if (is_interrupted()) {
                spdlog::warn("Received interrupt signal. Shutting down gracefully...");
                source.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });
}

} // namespace mtcopy::infra
