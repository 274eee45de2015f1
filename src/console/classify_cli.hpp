#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "app/voice_analyzer.hpp"
#include "core/config.hpp"

namespace console {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;    // at least one file was not classified

struct ClassifyOptions {
    core::Config run;             // seed with core::get_config() before parsing
    app::AnalysisConfig analysis;
    std::vector<std::string> paths;
};

enum class ParseResult { Ok, Help, UsageError };

/**
 * Parse voicecheck_classify arguments into opts.
 * On UsageError `error` names the offending option or value.
 */
ParseResult parse_classify_args(int argc, const char* const* argv, ClassifyOptions& opts, std::string& error);

void print_usage(std::ostream& os, const char* argv0);

// One JSON object for a single report, an array for several. Returns false if the
// document could not hold every report.
bool write_reports_json(std::ostream& os, const std::vector<app::AnalysisReport>& reports, bool verbose);

void write_reports_text(std::ostream& os, const std::vector<app::AnalysisReport>& reports, bool verbose);

// kExitOk when every report is Ok, kExitFailed otherwise.
int exit_code_for(const std::vector<app::AnalysisReport>& reports);

} // namespace console
