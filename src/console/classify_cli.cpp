#include "console/classify_cli.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iomanip>
#include <ArduinoJson.h>

namespace console {

namespace {

bool parse_double(const char* s, double& out) {
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || errno == ERANGE) return false;
    out = v;
    return true;
}

bool parse_int(const char* s, int& out) {
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || errno == ERANGE) return false;
    if (v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

size_t json_capacity(const std::vector<app::AnalysisReport>& reports) {
    size_t bytes = JSON_ARRAY_SIZE(reports.size()) + 64;
    for (const auto& r : reports) {
        bytes += JSON_OBJECT_SIZE(8) + JSON_OBJECT_SIZE(5) + JSON_OBJECT_SIZE(r.result.details.size());
        bytes += JSON_ARRAY_SIZE(r.result.explanation.size());
        bytes += r.source.size() + r.message.size() + 2;
        for (const auto& line : r.result.explanation) bytes += line.size() + 1;
        for (const auto& kv : r.result.details) bytes += kv.first.size() + 1;
    }
    return bytes;
}

void fill_report(JsonObject out, const app::AnalysisReport& r, bool verbose) {
    out["source"] = r.source;
    out["status"] = app::to_string(r.status);
    if (!r.ok()) {
        out["detail"] = r.message;
        return;
    }
    out["classification"] = detect::to_string(r.result.classification);
    out["confidence"] = r.result.confidence;
    JsonArray explanation = out.createNestedArray("explanation");
    for (const auto& line : r.result.explanation) explanation.add(line);
    JsonObject details = out.createNestedObject("details");
    for (const auto& kv : r.result.details) details[kv.first] = kv.second;
    if (verbose) {
        const auto& f = r.features;
        JsonObject features = out.createNestedObject("features");
        features["pitch_var"] = f.pitch_var;
        features["spectral_flatness_mean"] = f.spectral_flatness_mean;
        features["rms_var"] = f.rms_var;
        features["frames"] = f.frame_count;
        features["voiced_frames"] = f.voiced_frame_count;
    }
}

} // namespace

ParseResult parse_classify_args(int argc, const char* const* argv, ClassifyOptions& opts, std::string& error) {
    app::AnalysisConfig& cfg = opts.analysis;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        const bool has_value = i + 1 < argc;
        bool ok = true;
        if (a == "-h" || a == "--help") return ParseResult::Help;
        else if (a == "-v" || a == "--verbose") { opts.run.verbose = true; }
        else if (a == "--json") { opts.run.output = core::OutputFormat::Json; }
        else if (a == "--format" && has_value) { ok = core::parse_output_format(argv[++i], opts.run.output); }
        else if (a == "--threads" && has_value) { ok = parse_int(argv[++i], opts.run.threads) && opts.run.threads >= 0; }
        else if (a == "--n-mfcc" && has_value) { ok = parse_int(argv[++i], cfg.coefficient_count); }
        else if (a == "--pitch-threshold" && has_value) { ok = parse_double(argv[++i], cfg.decision.pitch_var_threshold); }
        else if (a == "--mfcc-threshold" && has_value) { ok = parse_double(argv[++i], cfg.decision.mfcc_var_threshold); }
        else if (a == "--pitch-weight" && has_value) { ok = parse_double(argv[++i], cfg.decision.pitch_weight); }
        else if (a == "--mfcc-weight" && has_value) { ok = parse_double(argv[++i], cfg.decision.mfcc_weight); }
        else if (a == "--min-duration" && has_value) { ok = parse_double(argv[++i], cfg.limits.min_duration_s); }
        else if (a == "--max-duration" && has_value) { ok = parse_double(argv[++i], cfg.limits.max_duration_s); }
        else if (a == "--min-peak" && has_value) {
            double v = 0.0;
            ok = parse_double(argv[++i], v);
            cfg.limits.min_peak = static_cast<float>(v);
        }
        else if (!a.empty() && a[0] == '-') {
            error = "Unknown or incomplete option: " + a;
            return ParseResult::UsageError;
        }
        else { opts.paths.push_back(a); }

        if (!ok) {
            error = "Invalid value for " + a + ": " + argv[i];
            return ParseResult::UsageError;
        }
    }
    if (opts.paths.empty()) {
        error = "No input files";
        return ParseResult::UsageError;
    }
    return ParseResult::Ok;
}

void print_usage(std::ostream& os, const char* argv0) {
    os << "Usage: " << argv0 << " [options] <file.wav> [more.wav ...]\n"
       << "  --json                 JSON output\n"
       << "  --format text|json     output format\n"
       << "  --threads N            worker threads for several files (0 = auto)\n"
       << "  --n-mfcc N             cepstral coefficients (default 13)\n"
       << "  --pitch-threshold X    pitch variance saturation point (default 500)\n"
       << "  --mfcc-threshold X     MFCC variance saturation point (default 50)\n"
       << "  --pitch-weight X       weight of the pitch score (default 0.7)\n"
       << "  --mfcc-weight X        weight of the MFCC score (default 0.3)\n"
       << "  --min-duration S       shortest accepted clip in seconds (default 0.1)\n"
       << "  --max-duration S       longest accepted clip in seconds (default 60)\n"
       << "  --min-peak X           silence threshold on peak amplitude (default 0.001)\n"
       << "  -v, --verbose          debug logging\n";
}

bool write_reports_json(std::ostream& os, const std::vector<app::AnalysisReport>& reports, bool verbose) {
    DynamicJsonDocument doc(json_capacity(reports));
    if (reports.size() == 1) {
        fill_report(doc.to<JsonObject>(), reports.front(), verbose);
    } else {
        JsonArray root = doc.to<JsonArray>();
        for (const auto& r : reports) fill_report(root.createNestedObject(), r, verbose);
    }
    if (doc.overflowed()) return false;
    serializeJsonPretty(doc, os);
    os << "\n";
    return true;
}

void write_reports_text(std::ostream& os, const std::vector<app::AnalysisReport>& reports, bool verbose) {
    for (const auto& r : reports) {
        os << r.source << "\n";
        if (!r.ok()) {
            os << "  error (" << app::to_string(r.status) << "): " << r.message << "\n";
            continue;
        }
        os << std::fixed << std::setprecision(4);
        os << "  " << detect::to_string(r.result.classification)
           << "  confidence " << r.result.confidence
           << "  (" << std::setprecision(2) << r.duration_s << " s @ " << r.sample_rate << " Hz)\n";
        os << std::setprecision(4);
        for (const auto& line : r.result.explanation) os << "  - " << line << "\n";
        for (const auto& kv : r.result.details) os << "  " << std::setw(18) << std::left << kv.first << kv.second << "\n";
        if (verbose) {
            const auto& f = r.features;
            os << "  pitch_var " << f.pitch_var << " (" << f.voiced_frame_count << "/" << f.frame_count
               << " voiced frames), flatness " << f.spectral_flatness_mean << ", rms_var " << f.rms_var << "\n";
        }
        os.unsetf(std::ios::fixed);
        os << std::right;
    }
}

int exit_code_for(const std::vector<app::AnalysisReport>& reports) {
    for (const auto& r : reports) {
        if (!r.ok()) return kExitFailed;
    }
    return kExitOk;
}

} // namespace console
