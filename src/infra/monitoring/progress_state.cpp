#include "progress_state.hpp"

namespace mtcopy::infra {

ProgressState::ProgressState()
    : started_at_(std::chrono::steady_clock::now())
{}

void ProgressState::record_enumerated(bool is_file, std::uint64_t size_bytes) {
    if (!is_file) return;
    files_total_.fetch_add(1, std::memory_order_release);
    bytes_total_.fetch_add(size_bytes, std::memory_order_release);
}

void ProgressState::record_completed(std::uint64_t size_bytes) {
    bytes_done_.fetch_add(size_bytes, std::memory_order_release);
    files_done_.fetch_add(1, std::memory_order_release);
}

void ProgressState::record_failed(std::uint64_t size_bytes) {
    files_failed_.fetch_add(1, std::memory_order_release);
    record_completed(size_bytes);
}

void ProgressState::mark_enumeration_complete() {
    enumeration_complete_.store(true, std::memory_order_release);
}

auto ProgressState::snapshot() const -> ProgressSnapshot {
    // Сначала done, потом total: задача учитывается в total до попадания в
    // очередь, поэтому прочитанный позже total не меньше прочитанного done.
    ProgressSnapshot s;
    s.enumeration_complete = enumeration_complete_.load(std::memory_order_acquire);
    s.files_failed = files_failed_.load(std::memory_order_acquire);
    s.files_done = files_done_.load(std::memory_order_acquire);
    s.bytes_done = bytes_done_.load(std::memory_order_acquire);
    s.files_total = files_total_.load(std::memory_order_acquire);
    s.bytes_total = bytes_total_.load(std::memory_order_acquire);
    s.started_at = started_at_;
    return s;
}

} // namespace mtcopy::infra
