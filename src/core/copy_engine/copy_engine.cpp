#include "copy_engine.hpp"
#include <filesystem>
#include <exception>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../infra/retry.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"
#include "../../infra/hash/xxhash_verifier.hpp"
#include "../../adapters/fs.hpp"
#include "../../extensions/metadata.hpp"

namespace mtcopy::core {

namespace fs = std::filesystem;

namespace {

struct QueueCloser {
    infra::BoundedQueue<CopyTask>& queue;
    ~QueueCloser() { queue.close(); }
};

} // namespace

CopyEngine::CopyEngine(const infra::Config& config,
                       infra::ProgressState& progress)
    : config_(config), progress_(progress) {}

auto CopyEngine::validate_setup(const fs::path& source,
                                const fs::path& destination) const
    -> infra::VoidResult
{
    std::error_code ec;
    const auto dst_status = fs::status(destination, ec);
    if (fs::exists(dst_status) && !fs::is_directory(dst_status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NotADirectory,
            fmt::format("Destination exists and is not a directory: {}", destination.string())));
    }

    // Копирование в собственное поддерево никогда не закончится
    std::error_code src_ec, dst_ec;
    const auto src_canon = fs::weakly_canonical(source, src_ec);
    const auto dst_canon = fs::weakly_canonical(destination, dst_ec);
    if (!src_ec && !dst_ec) {
        const auto rel = dst_canon.lexically_relative(src_canon);
        if (!rel.empty() && *rel.begin() != "..") {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                fmt::format("Destination {} is inside source {}", destination.string(), source.string())));
        }
    }
    return {};
}

auto CopyEngine::run(const fs::path& source,
                     const fs::path& destination,
                     std::stop_token stop)
    -> infra::Result<RunReport>
{
    if (started_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "CopyEngine::run may only be called once"));
    }
    started_ = true;

    const auto threads = config_.threads.value_or(0);
    if (threads == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "Thread count must be a positive integer"));
    }

    auto enumerator = TreeEnumerator::open(source, config_.exclude_patterns);
    if (!enumerator) {
        return std::unexpected(std::move(enumerator.error()));
    }

    if (auto res = validate_setup(source, destination); !res) {
        return std::unexpected(std::move(res.error()));
    }

    source_ = source;
    destination_ = destination;
    materializer_ = std::make_unique<DirectoryMaterializer>(destination);
    if (auto res = materializer_->ensure({}); !res) {
        auto error = std::move(res.error());
        error.message = fmt::format("Cannot create destination: {}", error.message);
        return std::unexpected(std::move(error));
    }

    spdlog::debug("Copying {} -> {} with {} threads", source.string(), destination.string(), threads);
    const auto start_time = std::chrono::steady_clock::now();

    TaskQueue queue{config_.queue_capacity_or_default()};
    // Остановка закрывает очередь: производитель и рабочие просыпаются
    std::stop_callback on_stop(stop, [&queue] { queue.close(); });

    infra::ThreadPool pool{threads};
    // Объявлен после pool: при любом выходе из run очередь закрывается
    // раньше, чем ~ThreadPool начнёт ждать рабочих, висящих в pop()
    const QueueCloser close_on_exit{queue};

    try {
        pool.start([this, &queue, stop](std::size_t, std::stop_token) {
            worker_loop(queue, stop);
        });
    } catch (const std::system_error& e) {
        return std::unexpected(infra::make_system_error(
            e.code(), fmt::format("Cannot start {} worker threads", threads)));
    }

    produce(*enumerator, queue, stop);
    progress_.mark_enumeration_complete();
    queue.close();

    spdlog::debug("Enumeration finished, waiting for workers...");
    pool.wait();

    const auto snapshot = progress_.snapshot();
    RunReport report;
    report.files_total = snapshot.files_total;
    report.bytes_total = snapshot.bytes_total;
    report.files_copied = stats_.files_copied.load();
    report.bytes_copied = stats_.bytes_copied.load();
    report.files_skipped = stats_.files_skipped.load();
    report.links_copied = stats_.links_copied.load();
    report.links_skipped = stats_.links_skipped.load();
    report.entries_ignored = stats_.entries_ignored.load();
    report.directories = stats_.directories.load();
    report.interrupted = stop.stop_requested();
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    {
        std::lock_guard lock(failures_mutex_);
        report.failures = std::move(failures_);
    }
    // Только обычные файлы; отказы каталогов и ссылок есть в failures
    report.files_failed = snapshot.files_failed;
    report.warnings = enumerator->warnings();

    if (report.interrupted) {
        spdlog::warn("Copy interrupted: {}/{} files processed", snapshot.files_done, snapshot.files_total);
    }
    return report;
}

void CopyEngine::produce(TreeEnumerator& enumerator, TaskQueue& queue, std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto entry = enumerator.next();
        if (!entry) break;

        switch (entry->kind) {
            case EntryKind::Directory: {
                // Пустые каталоги тоже должны появиться в назначении
                auto res = materializer_->ensure(entry->relative_path);
                if (res) {
                    stats_.directories.fetch_add(1, std::memory_order_relaxed);
                } else {
                    add_failure(entry->relative_path, std::move(res.error()));
                }
                break;
            }
            case EntryKind::RegularFile: {
                progress_.record_enumerated(true, entry->size_bytes);
                if (!queue.push(CopyTask{std::move(entry->relative_path), entry->size_bytes})) {
                    return; // очередь закрыта остановкой
                }
                break;
            }
            case EntryKind::Symlink: {
                if (config_.symlinks_or_default() == infra::SymlinkPolicy::Skip) {
                    spdlog::debug("Skipping symlink {}", entry->relative_path.string());
                    stats_.entries_ignored.fetch_add(1, std::memory_order_relaxed);
                    break;
                }
                auto res = copy_link(entry->relative_path);
                if (!res) {
                    add_failure(entry->relative_path, std::move(res.error()));
                } else if (*res == CopyOutcome::Copied) {
                    stats_.links_copied.fetch_add(1, std::memory_order_relaxed);
                } else {
                    stats_.links_skipped.fetch_add(1, std::memory_order_relaxed);
                }
                break;
            }
            case EntryKind::Other:
                spdlog::warn("Skipping special file {}", entry->relative_path.string());
                stats_.entries_ignored.fetch_add(1, std::memory_order_relaxed);
                break;
        }
    }
}

void CopyEngine::worker_loop(TaskQueue& queue, std::stop_token stop) {
    while (!stop.stop_requested()) {
        auto task = queue.pop();
        if (!task) {
            return; // очередь закрыта и пуста
        }
        // Начатое копирование не прерывается, новое не начинаем
        if (stop.stop_requested()) {
            return;
        }
        process_task(*task);
    }
}

void CopyEngine::process_task(const CopyTask& task) {
    infra::Result<CopyOutcome> res = std::unexpected(
        infra::make_error(infra::ErrorCode::Unknown, "not started"));
    try {
        res = copy_file(task);
    } catch (const std::exception& e) {
        res = std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Unexpected error copying {}: {}", task.relative_path.string(), e.what())));
    }

    if (!res) {
        add_failure(task.relative_path, std::move(res.error()));
        progress_.record_failed(task.size_bytes); // файл обработан, хоть и неуспешно
        return;
    }

    if (*res == CopyOutcome::Copied) {
        stats_.files_copied.fetch_add(1, std::memory_order_relaxed);
        stats_.bytes_copied.fetch_add(task.size_bytes, std::memory_order_relaxed);
    } else {
        stats_.files_skipped.fetch_add(1, std::memory_order_relaxed);
    }
    progress_.record_completed(task.size_bytes);
}

auto CopyEngine::resolve_conflict(const fs::path& dst) -> infra::Result<bool> {
    std::error_code ec;
    const auto status = fs::symlink_status(dst, ec);
    if (!fs::exists(status)) {
        return false;
    }

    if (fs::is_directory(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::AlreadyExists,
            fmt::format("Destination {} exists and is a directory", dst.string())));
    }

    switch (config_.on_conflict_or_default()) {
        case infra::ConflictPolicy::Skip:
            spdlog::debug("Skipping existing file: {}", dst.string());
            return true;
        case infra::ConflictPolicy::Error:
            return std::unexpected(infra::make_error(infra::ErrorCode::AlreadyExists,
                fmt::format("Destination file already exists: {}", dst.string())));
        case infra::ConflictPolicy::Overwrite:
            break;
    }

    fs::remove(dst, ec);
    if (ec) {
        return std::unexpected(infra::make_system_error(
            ec, fmt::format("Cannot remove existing file {}", dst.string())));
    }
    return false;
}

auto CopyEngine::copy_file(const CopyTask& task) -> infra::Result<CopyOutcome> {
    const auto src = source_ / task.relative_path;
    const auto dst = destination_ / task.relative_path;

    if (auto res = materializer_->ensure(task.relative_path.parent_path()); !res) {
        return std::unexpected(std::move(res.error()));
    }

    auto skip = resolve_conflict(dst);
    if (!skip) {
        return std::unexpected(std::move(skip.error()));
    }
    if (*skip) {
        return CopyOutcome::Skipped;
    }

    const auto strategy = adapters::fs::select_strategy(task.size_bytes);
    const infra::RetryPolicy retry{
        .max_attempts = static_cast<int>(config_.retry_attempts_or_default())
    };
    auto res = infra::with_retry([&]() {
        return adapters::fs::copy_file(src, dst, strategy);
    }, retry);
    if (!res) {
        return std::unexpected(std::move(res.error()));
    }

    if (config_.verify) {
        if (auto verified = infra::XXHashVerifier::verify_copy(src, dst); !verified) {
            // Несовпадающая копия не должна остаться в назначении
            std::error_code ec;
            fs::remove(dst, ec);
            return std::unexpected(std::move(verified.error()));
        }
    }

    // Копируем метаданные после успешной верификации
    preserve_metadata(src, dst, task.relative_path);
    return CopyOutcome::Copied;
}

auto CopyEngine::copy_link(const fs::path& relative) -> infra::Result<CopyOutcome> {
    if (auto res = materializer_->ensure(relative.parent_path()); !res) {
        return std::unexpected(std::move(res.error()));
    }

    const auto dst = destination_ / relative;
    auto skip = resolve_conflict(dst);
    if (!skip) {
        return std::unexpected(std::move(skip.error()));
    }
    if (*skip) {
        return CopyOutcome::Skipped;
    }
    const auto src = source_ / relative;
    if (auto res = adapters::fs::copy_symlink(src, dst); !res) {
        return std::unexpected(std::move(res.error()));
    }
    preserve_metadata(src, dst, relative);
    return CopyOutcome::Copied;
}

// Ошибка метаданных не делает копию неудачной
void CopyEngine::preserve_metadata(const fs::path& src, const fs::path& dst,
                                   const fs::path& relative) const
{
    if (!config_.preserve_metadata) return;
    if (auto res = extensions::copy_metadata(src, dst); !res) {
        spdlog::warn("Failed to copy metadata for {}: {}", relative.string(), res.error().message);
    }
}

void CopyEngine::add_failure(const fs::path& relative, infra::Error&& error) {
    auto logged = infra::log_and_return(std::move(error));
    std::lock_guard lock(failures_mutex_);
    failures_.push_back(TaskFailure{relative, std::move(logged)});
}

} // namespace mtcopy::core
