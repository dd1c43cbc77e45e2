#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <expected>


namespace mtcopy::args_parser {

struct CLIArgs
{
    std::string source;                        // 1-й позиционный
    std::string destination;                   // 2-й позиционный
    std::optional<std::uint32_t> threads;      // 3-й позиционный, > 0
    bool verify{false};                        // --verify
    bool progress{true};                       // --no-progress
    bool quiet{false};                         // -q, --quiet
    bool preserve_metadata{true};              // --no-preserve-metadata
    std::optional<std::string> symlinks;       // --symlinks=copy|skip
    std::optional<std::string> on_conflict;    // --on-conflict=overwrite|skip|error
    std::optional<std::size_t> queue_capacity; // --queue-capacity=N
    std::optional<std::string> log_level;      // --log-level=LEVEL
    std::vector<std::string> exclude_patterns; // --exclude=REGEX (можно несколько)
};


/// Parses command-line arguments.
/// On --help, --version or a parse error returns the process exit code instead
/// (the message has already been printed by CLI11).
[[nodiscard]] auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int>;

} // namespace mtcopy::args_parser
