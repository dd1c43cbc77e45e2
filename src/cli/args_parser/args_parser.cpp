#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <git_info.hpp>

namespace mtcopy::args_parser {

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>
{
    CLIArgs args;
    CLI::App app{"mtcopy - multithreaded directory tree copy", "mtcopy"};

    constexpr auto git = mtcopy::build_info::get_git_info();
    app.set_version_flag("--version",
                         fmt::format("mtcopy {} ({}{})", git.branch, git.commit_short,
                                     git.dirty ? ", dirty" : ""));

    std::uint32_t threads = 0;
    app.add_option("source", args.source, "Source directory")->required();
    app.add_option("destination", args.destination, "Destination directory")->required();
    app.add_option("threads", threads, "Number of worker threads")
        ->required()
        ->check(CLI::PositiveNumber);

    app.add_flag("-q,--quiet", args.quiet, "Suppress progress and summary output");
    app.add_flag("--progress,!--no-progress", args.progress, "Show the live progress line");
    app.add_flag("--verify", args.verify, "Compare xxHash64 of source and copy");
    app.add_flag("--preserve-metadata,!--no-preserve-metadata", args.preserve_metadata,
                 "Copy permissions and timestamps");

    app.add_option("--symlinks", args.symlinks, "Symbolic link handling")
        ->check(CLI::IsMember({"copy", "skip"}));
    app.add_option("--on-conflict", args.on_conflict, "Existing destination file handling")
        ->check(CLI::IsMember({"overwrite", "skip", "error"}));
    app.add_option("--queue-capacity", args.queue_capacity, "Maximum pending copy tasks")
        ->check(CLI::PositiveNumber);
    app.add_option("--log-level", args.log_level, "trace|debug|info|warn|error|critical|off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.add_option("--exclude", args.exclude_patterns, "Skip entries whose name matches REGEX")
        ->expected(1)
        ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }

    args.threads = threads;
    return args;
}

} // namespace mtcopy::args_parser
