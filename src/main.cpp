#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "infra/monitoring/progress_state.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/copy_engine/copy_engine.hpp"
#include "core/report/run_report.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <stop_token>

using GIT = mtcopy::build_info::GitInfo;

constexpr auto load_from_cli = mtcopy::infra::config_from_cli;
constexpr auto load_config_file = mtcopy::infra::load_config_from_file;
constexpr auto args_parser = mtcopy::args_parser::parse_args;
constexpr auto git = mtcopy::build_info::get_git_info();

static auto
log_git_verse(const GIT& git)
-> void {
    spdlog::debug("Git branch: {}", git.branch);
    spdlog::debug("Git commit: {}{}", git.commit, git.dirty ? " (dirty)" : "");
    spdlog::debug("Build timestamp (UTC): {}", git.timestamp);
}

static auto
log_config_verse(const mtcopy::infra::Config& config)
-> void {
    spdlog::debug("Threads: {}", config.threads.value_or(0));
    spdlog::debug("Queue capacity: {}", config.queue_capacity_or_default());
    spdlog::debug("Symlinks: {}", mtcopy::infra::to_string(config.symlinks_or_default()));
    spdlog::debug("On conflict: {}", mtcopy::infra::to_string(config.on_conflict_or_default()));
    spdlog::debug("Verify: {}", config.verify ? "yes" : "no");
    spdlog::debug("Preserve metadata: {}", config.preserve_metadata ? "yes" : "no");
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        mtcopy::infra::install_signal_handler();

        auto args_res = args_parser(argc, argv);
        if (!args_res) {
            return args_res.error(); // --help, --version или ошибка разбора
        }
        const auto& args = *args_res;

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return mtcopy::infra::kExitSetupError;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        auto cli_config = load_from_cli(args);
        config.merge_with(cli_config); // CLI имеет приоритет

        if (config.log_level) {
            spdlog::set_level(spdlog::level::from_str(*config.log_level));
        } else if (config.quiet) {
            spdlog::set_level(spdlog::level::warn);
        }

        log_git_verse(git);
        log_config_verse(config);

        // Сигнал -> request_stop() для текущего запуска
        std::stop_source stop_source;
        auto interrupt_watcher = mtcopy::infra::watch_interrupts(stop_source);

        mtcopy::infra::ProgressState progress;
        mtcopy::infra::ProgressMonitor monitor(progress, mtcopy::infra::ProgressMonitor::Options{
            .enabled = config.progress && !config.quiet,
            .refresh_interval = std::chrono::milliseconds(config.refresh_interval_or_default()),
        });

        mtcopy::core::CopyEngine engine(config, progress);
        auto result = engine.run(args.source, args.destination, stop_source.get_token());
        monitor.finish();

        if (!result) {
            const auto& err = result.error();
            spdlog::error("Copy operation failed: {}", err.message);
            return err.to_exit_code();
        }

        const auto& report = *result;
        if (!config.quiet) {
            mtcopy::core::print_summary(report);
        }
        return mtcopy::core::exit_code(report);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return mtcopy::infra::kExitSetupError;
    }
}
