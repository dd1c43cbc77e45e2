#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace mtcopy::infra {

/// Пул из фиксированного числа потоков. Каждый поток выполняет один и тот же
/// рабочий цикл (обычно "взять задачу из очереди, выполнить, повторить"),
/// пока цикл не вернёт управление. Размер пула не меняется после создания.
class ThreadPool {
public:
    using WorkerLoop = std::function<void(std::size_t worker_index, std::stop_token st)>;

    explicit ThreadPool(std::size_t nthreads);
    ~ThreadPool();

    // Удалить копирование и присваивание
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Запуск рабочих потоков (однократно)
    void start(WorkerLoop loop);

    // Блокирующее ожидание завершения всех потоков.
    // Перебрасывает первое исключение, вылетевшее из рабочего цикла.
    void wait();

    void request_stop();

    [[nodiscard]] auto size() const -> std::size_t { return nthreads_; }

private:
    const std::size_t nthreads_;
    std::vector<std::jthread> workers_;
    std::mutex error_mutex_;
    std::exception_ptr first_error_;
};

inline ThreadPool::ThreadPool(std::size_t nthreads)
    : nthreads_(nthreads)
{
    if (nthreads_ == 0) {
        throw std::invalid_argument("ThreadPool requires at least one thread");
    }
}

inline ThreadPool::~ThreadPool() {
    request_stop();
    // jthread автоматически вызовет join
}

inline void ThreadPool::start(WorkerLoop loop) {
    if (!workers_.empty()) {
        throw std::logic_error("ThreadPool is already started");
    }
    workers_.reserve(nthreads_);

    for (std::size_t i = 0; i < nthreads_; ++i) {
        workers_.emplace_back([this, loop, i](std::stop_token st) {
            try {
                loop(i, st);
            } catch (...) {
                std::lock_guard lock(error_mutex_);
                if (!first_error_) {
                    first_error_ = std::current_exception();
                }
            }
        });
    }
}

inline void ThreadPool::wait() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::exception_ptr error;
    {
        std::lock_guard lock(error_mutex_);
        error = std::exchange(first_error_, nullptr);
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

inline void ThreadPool::request_stop() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

} // namespace mtcopy::infra
