#include <cassert>
#include <sstream>
#include <string>
#include <vector>
#include <ArduinoJson.h>
#include "console/classify_cli.hpp"

static console::ParseResult parse(std::vector<const char*> args, console::ClassifyOptions& opts, std::string& error) {
    args.insert(args.begin(), "voicecheck_classify");
    opts = console::ClassifyOptions{};
    error.clear();
    return console::parse_classify_args(static_cast<int>(args.size()), args.data(), opts, error);
}

static app::AnalysisReport classified(const std::string& source) {
    app::AnalysisReport r;
    r.source = source;
    r.duration_s = 2.0;
    r.sample_rate = 22050;
    r.features.pitch_var = 800.0;
    r.features.mfcc_var.assign(13, 60.0);
    r.result = detect::classify(r.features);
    return r;
}

static app::AnalysisReport failed(const std::string& source) {
    app::AnalysisReport r;
    r.source = source;
    r.status = app::AnalysisReport::Status::LoadFailed;
    r.message = "Could not process audio file";
    return r;
}

int main() {
    console::ClassifyOptions opts;
    std::string error;

    // Options and paths
    {
        auto res = parse({"--json", "--threads", "3", "--n-mfcc", "20", "--pitch-weight", "0.6",
                          "--min-peak", "0.01", "a.wav", "b.wav"}, opts, error);
        assert(res == console::ParseResult::Ok);
        assert(opts.run.output == core::OutputFormat::Json);
        assert(opts.run.threads == 3);
        assert(opts.analysis.coefficient_count == 20);
        assert(opts.analysis.decision.pitch_weight == 0.6);
        assert(opts.analysis.limits.min_peak == 0.01f);
        assert(opts.paths.size() == 2 && opts.paths[1] == "b.wav");

        assert(parse({"--format", "text", "-v", "x.wav"}, opts, error) == console::ParseResult::Ok);
        assert(opts.run.output == core::OutputFormat::Text && opts.run.verbose);
        assert(parse({"-h"}, opts, error) == console::ParseResult::Help);
    }
    // Usage errors
    {
        assert(parse({}, opts, error) == console::ParseResult::UsageError);
        assert(parse({"--threads", "x", "a.wav"}, opts, error) == console::ParseResult::UsageError);
        assert(error.find("--threads") != std::string::npos);
        assert(parse({"--threads", "-2", "a.wav"}, opts, error) == console::ParseResult::UsageError);
        assert(parse({"--format", "xml", "a.wav"}, opts, error) == console::ParseResult::UsageError);
        assert(parse({"--bogus", "a.wav"}, opts, error) == console::ParseResult::UsageError);
        assert(parse({"a.wav", "--n-mfcc"}, opts, error) == console::ParseResult::UsageError);
        assert(parse({"--pitch-threshold", "1e999", "a.wav"}, opts, error) == console::ParseResult::UsageError);
        // Out of int range is rejected, not wrapped
        assert(parse({"--n-mfcc", "4294967309", "a.wav"}, opts, error) == console::ParseResult::UsageError);
        assert(opts.analysis.coefficient_count == features::kDefaultCoefficientCount);
        assert(parse({"--threads", "99999999999999999999", "a.wav"}, opts, error) == console::ParseResult::UsageError);
    }
    // One report is a single object
    {
        std::ostringstream os;
        assert(console::write_reports_json(os, {classified("one.wav")}, false));
        DynamicJsonDocument doc(4096);
        assert(!deserializeJson(doc, os.str()));
        assert(doc.is<JsonObject>());
        assert(std::string(doc["source"].as<const char*>()) == "one.wav");
        assert(std::string(doc["status"].as<const char*>()) == "ok");
        assert(std::string(doc["classification"].as<const char*>()) == "HUMAN");
        assert(doc["confidence"].as<double>() > 0.5);
        assert(doc["explanation"].size() >= 1);
        assert(doc["details"].containsKey("human_probability"));
        assert(!doc.containsKey("features"));
    }
    // Several reports form an array; failures carry a detail and no verdict
    {
        std::ostringstream os;
        const std::vector<app::AnalysisReport> reports = {classified("a \"quoted\" name.wav"), failed("missing.wav")};
        assert(console::write_reports_json(os, reports, true));
        DynamicJsonDocument doc(8192);
        assert(!deserializeJson(doc, os.str()));
        assert(doc.is<JsonArray>() && doc.size() == 2);
        assert(std::string(doc[0]["source"].as<const char*>()) == "a \"quoted\" name.wav");
        assert(doc[0]["features"]["frames"].as<int>() == 0);
        assert(std::string(doc[1]["status"].as<const char*>()) == "load_failed");
        assert(std::string(doc[1]["detail"].as<const char*>()) == "Could not process audio file");
        assert(!doc[1].containsKey("classification"));
    }
    // Exit status
    {
        assert(console::exit_code_for({classified("a.wav"), classified("b.wav")}) == console::kExitOk);
        assert(console::exit_code_for({classified("a.wav"), failed("b.wav")}) == console::kExitFailed);
    }
    // Text output names failures
    {
        std::ostringstream os;
        console::write_reports_text(os, {failed("gone.wav")}, false);
        assert(os.str().find("error (load_failed): Could not process audio file") != std::string::npos);
    }
    return 0;
}
