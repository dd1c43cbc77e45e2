#pragma once

#include "error_handler/error.hpp"
#include <chrono>
#include <cmath>
#include <thread>

namespace mtcopy::infra {
/*

auto res = infra::with_retry([&]() {
    return adapters::fs::copy_file(src, dst, strategy);
}, infra::RetryPolicy{ .max_attempts = 5 });

Повторяются только transient-ошибки (Error::is_transient).
*/
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(50);
    double backoff_factor = 2.0; // exponential backoff
};

template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {})
    -> decltype(operation())
{
    const int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;

    for (int attempt = 0;; ++attempt) {
        auto result = operation();
        if (result.has_value()) {
            return result; // успех
        }

        const auto& err = result.error();
        if (!err.is_transient() || attempt + 1 >= attempts) {
            return result; // постоянная ошибка или последняя попытка
        }

        // Экспоненциальная задержка
        auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
            policy.initial_delay * std::pow(policy.backoff_factor, attempt));
        std::this_thread::sleep_for(delay);
    }
}

} // namespace mtcopy::infra
