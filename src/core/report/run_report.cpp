#include "run_report.hpp"
#include <fmt/core.h>
#include "../../infra/monitoring/monitoring.hpp"

namespace mtcopy::core {

auto exit_code(const RunReport& report) -> int {
    if (report.interrupted) return infra::kExitInterrupted;
    if (!report.failures.empty() || !report.warnings.empty()) return infra::kExitPartialFailure;
    return infra::kExitSuccess;
}

auto format_summary(const RunReport& report) -> std::string {
    using infra::ProgressMonitor;

    std::string out;
    out += fmt::format("Files copied:  {}/{}\n", report.files_copied, report.files_total);
    if (report.files_skipped > 0) {
        out += fmt::format("Files skipped: {} (already present)\n", report.files_skipped);
    }
    if (report.links_copied > 0) {
        out += fmt::format("Links copied:  {}\n", report.links_copied);
    }
    if (report.links_skipped > 0) {
        out += fmt::format("Links skipped: {} (already present)\n", report.links_skipped);
    }
    out += fmt::format("Directories:   {}\n", report.directories);
    if (report.entries_ignored > 0) {
        out += fmt::format("Ignored:       {} (links or special files)\n", report.entries_ignored);
    }
    out += fmt::format("Bytes copied:  {} ({})\n", report.bytes_copied,
                       ProgressMonitor::format_bytes(static_cast<double>(report.bytes_copied)));
    out += fmt::format("Elapsed:       {}.{:03d}\n",
                       ProgressMonitor::format_duration(report.elapsed),
                       report.elapsed.count() % 1000);

    const auto seconds = std::chrono::duration<double>(report.elapsed).count();
    if (report.bytes_copied > 0 && seconds > 0) {
        out += fmt::format("Average speed: {}/s\n",
                           ProgressMonitor::format_bytes(report.bytes_copied / seconds));
    }

    if (report.failures.size() > report.files_failed) {
        out += fmt::format("Failed:        {} ({} files)\n", report.failures.size(), report.files_failed);
    } else {
        out += fmt::format("Failed:        {}\n", report.failures.size());
    }
    for (const auto& failure : report.failures) {
        out += fmt::format("  {}: {} ({})\n", failure.relative_path.string(),
                           failure.error.message, infra::to_string(failure.error.code));
    }

    if (!report.warnings.empty()) {
        out += fmt::format("Unreadable subtrees: {}\n", report.warnings.size());
        for (const auto& warning : report.warnings) {
            out += fmt::format("  {}: {}\n",
                               warning.relative_path.empty() ? std::string(".") : warning.relative_path.string(),
                               warning.error.message);
        }
    }

    if (report.interrupted) {
        out += "Interrupted: remaining files were not copied\n";
    }
    return out;
}

void print_summary(const RunReport& report, std::FILE* out) {
    fmt::print(out, "{}", format_summary(report));
    std::fflush(out);
}

} // namespace mtcopy::core
