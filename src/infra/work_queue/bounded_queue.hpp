#pragma once

#include <cstddef>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace mtcopy::infra {

/// Потокобезопасная очередь ограниченной ёмкости (много производителей,
/// много потребителей).
///
/// push() блокируется, пока очередь заполнена; pop() блокируется, пока
/// очередь пуста. После close() новые элементы не принимаются, а pop()
/// возвращает std::nullopt, как только очередь опустеет.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity);

    // Удалить копирование и присваивание
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // false, если очередь закрыта (элемент не добавлен)
    [[nodiscard]] bool push(T item);

    [[nodiscard]] auto pop() -> std::optional<T>;

    // Идемпотентно; будит всех ожидающих
    void close();

    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

private:
    const std::size_t capacity_;
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    bool closed_ = false;
};

// =============== Реализация шаблонов ===============

template<typename T>
BoundedQueue<T>::BoundedQueue(std::size_t capacity)
    : capacity_(capacity)
{
    if (capacity_ == 0) {
        throw std::invalid_argument("BoundedQueue capacity must be positive");
    }
}

template<typename T>
bool BoundedQueue<T>::push(T item) {
    {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] {
            return closed_ || items_.size() < capacity_;
        });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
    }
    not_empty_.notify_one();
    return true;
}

template<typename T>
auto BoundedQueue<T>::pop() -> std::optional<T> {
    std::optional<T> item;
    {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] {
            return closed_ || !items_.empty();
        });
        if (items_.empty()) {
            return std::nullopt; // закрыта и пуста
        }
        item.emplace(std::move(items_.front()));
        items_.pop_front();
    }
    not_full_.notify_one();
    return item;
}

template<typename T>
void BoundedQueue<T>::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    not_full_.notify_all();
    not_empty_.notify_all();
}

template<typename T>
bool BoundedQueue<T>::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

template<typename T>
auto BoundedQueue<T>::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return items_.size();
}

} // namespace mtcopy::infra
