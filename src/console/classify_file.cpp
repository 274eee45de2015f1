// Console classifier: WAV file(s) in, HUMAN / AI_GENERATED verdicts out
#include <iostream>
#include <string>
#include <vector>
#include "app/voice_analyzer.hpp"
#include "console/classify_cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"

int main(int argc, char** argv) {
    console::ClassifyOptions opts;
    opts.run = core::get_config();
    std::string error;
    switch (console::parse_classify_args(argc, argv, opts, error)) {
    case console::ParseResult::Help:
        console::print_usage(std::cout, argv[0]);
        return console::kExitOk;
    case console::ParseResult::UsageError:
        std::cerr << error << "\n";
        console::print_usage(std::cerr, argv[0]);
        return console::kExitUsage;
    case console::ParseResult::Ok:
        break;
    }

    core::set_config(opts.run);
    const app::AnalysisConfig& cfg = opts.analysis;
    core::log_debug("n_mfcc=" + std::to_string(cfg.coefficient_count) +
                    " pitch_threshold=" + std::to_string(cfg.decision.pitch_var_threshold) +
                    " mfcc_threshold=" + std::to_string(cfg.decision.mfcc_var_threshold));

    app::VoiceAnalyzer analyzer(cfg);
    const std::vector<app::AnalysisReport> reports = analyzer.analyze_files(opts.paths, opts.run.threads);

    if (opts.run.output == core::OutputFormat::Json) {
        if (!console::write_reports_json(std::cout, reports, opts.run.verbose)) {
            core::log_error("JSON document too small for " + std::to_string(reports.size()) + " report(s)");
            return console::kExitFailed;
        }
    } else {
        console::write_reports_text(std::cout, reports, opts.run.verbose);
    }

    const int code = console::exit_code_for(reports);
    if (code != console::kExitOk) {
        int failures = 0;
        for (const auto& r : reports) failures += r.ok() ? 0 : 1;
        core::log_info(std::to_string(failures) + " of " + std::to_string(reports.size()) + " file(s) not classified");
    }
    return code;
}
