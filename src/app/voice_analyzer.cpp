// Copyright (c) 2026 VoiceCheck
// Application API - Voice Analyzer Implementation

#include "app/voice_analyzer.hpp"
#include "audio/wav_reader.hpp"
#include "core/logging.hpp"
#include "core/parallel_for.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>

namespace app {

const char* to_string(AnalysisReport::Status s) {
    switch (s) {
    case AnalysisReport::Status::Ok: return "ok";
    case AnalysisReport::Status::LoadFailed: return "load_failed";
    case AnalysisReport::Status::InvalidInput: return "invalid_input";
    case AnalysisReport::Status::ExtractionFailed: return "extraction_failed";
    }
    return "unknown";
}

VoiceAnalyzer::VoiceAnalyzer(const AnalysisConfig& config) : config_(config) {}

AnalysisReport VoiceAnalyzer::analyze_waveform(const audio::Waveform& waveform, const std::string& source) const {
    AnalysisReport report;
    report.source = source;
    report.sample_rate = waveform.sample_rate;
    report.duration_s = waveform.duration_seconds();

    const audio::ValidationResult check = audio::validate_waveform(waveform, config_.limits);
    if (!check.ok()) {
        report.status = AnalysisReport::Status::InvalidInput;
        report.message = check.message;
        core::log_warn(source + ": " + check.message);
        return report;
    }

    auto t0 = std::chrono::steady_clock::now();
    try {
        report.features = features::extract(waveform.samples, waveform.sample_rate,
                                            config_.coefficient_count, config_.extractor);
    } catch (const features::FeatureExtractionError& e) {
        // Reported as-is; no substitute classification is made up here
        report.status = AnalysisReport::Status::ExtractionFailed;
        report.message = e.what();
        core::log_error(source + ": " + e.what());
        return report;
    }
    report.result = detect::classify(report.features, config_.decision);
    auto t1 = std::chrono::steady_clock::now();

    if (core::is_verbose()) {
        std::ostringstream os;
        os << source << ": " << report.features.frame_count << " frames, "
           << report.features.voiced_frame_count << " voiced, pitch_var=" << report.features.pitch_var
           << " -> " << detect::to_string(report.result.classification)
           << " (" << std::chrono::duration<double, std::milli>(t1 - t0).count() << " ms)";
        core::log_debug(os.str());
    }
    return report;
}

AnalysisReport VoiceAnalyzer::analyze_file(const std::string& path) const {
    audio::Waveform waveform;
    if (!audio::read_wav_mono(path, waveform)) {
        AnalysisReport report;
        report.source = path;
        report.status = AnalysisReport::Status::LoadFailed;
        report.message = "Could not process audio file";
        return report;
    }
    return analyze_waveform(waveform, path);
}

std::vector<AnalysisReport> VoiceAnalyzer::analyze_files(const std::vector<std::string>& paths, int threads) const {
    std::vector<AnalysisReport> reports(paths.size());
    if (paths.empty()) return reports;

    unsigned n_workers = threads > 0 ? static_cast<unsigned>(threads) : std::thread::hardware_concurrency();
    n_workers = std::max(1u, std::min<unsigned>(n_workers, static_cast<unsigned>(paths.size())));
    core::log_debug("analysing " + std::to_string(paths.size()) + " file(s) on " +
                    std::to_string(n_workers) + " worker(s)");

    // Each index writes only its own slot
    core::parallel_for(paths.size(), n_workers, [&](size_t i) { reports[i] = analyze_file(paths[i]); });
    return reports;
}

} // namespace app
