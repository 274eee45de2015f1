// Copyright (c) 2026 VoiceCheck
// Application API - Voice Analyzer
//
// Composes loading, validation, feature extraction and classification
// for single waveforms, single files, or batches of files.

#pragma once

#include "audio/waveform.hpp"
#include "audio/waveform_validator.hpp"
#include "detect/decision_engine.hpp"
#include "features/feature_extractor.hpp"

#include <string>
#include <vector>

namespace app {

//==============================================================================
// Configuration
//==============================================================================

/// Everything needed to analyse one recording
struct AnalysisConfig {
    features::ExtractorConfig extractor;          ///< Framing, mel bank and pitch band
    int coefficient_count = features::kDefaultCoefficientCount;  ///< MFCCs per frame
    detect::DecisionConfig decision;              ///< Calibration thresholds and weights
    audio::ValidationLimits limits;               ///< Duration and silence bounds
};

//==============================================================================
// Result
//==============================================================================

/// Outcome of one analysis
struct AnalysisReport {
    enum class Status {
        Ok,                                       ///< Classified
        LoadFailed,                               ///< File could not be decoded
        InvalidInput,                             ///< Rejected by waveform validation
        ExtractionFailed                          ///< FeatureExtractionError raised
    };

    std::string source;                           ///< File path or caller-supplied label
    Status status = Status::Ok;
    std::string message;                          ///< Failure reason; empty when Ok
    double duration_s = 0.0;
    int sample_rate = 0;
    features::FeatureVector features;             ///< Valid when status == Ok
    detect::ClassificationResult result;          ///< Valid when status == Ok

    bool ok() const { return status == Status::Ok; }
};

const char* to_string(AnalysisReport::Status s);

//==============================================================================
// Analyzer
//==============================================================================

/// Stateless after construction; every method is safe to call from several threads.
class VoiceAnalyzer {
public:
    explicit VoiceAnalyzer(const AnalysisConfig& config = AnalysisConfig{});

    /// Validate, extract and classify an in-memory waveform
    AnalysisReport analyze_waveform(const audio::Waveform& waveform, const std::string& source) const;

    /// Load a WAV file and analyse it
    AnalysisReport analyze_file(const std::string& path) const;

    /// Analyse several files on up to `threads` workers (0 = hardware concurrency).
    /// Reports come back in input order.
    std::vector<AnalysisReport> analyze_files(const std::vector<std::string>& paths, int threads = 0) const;

    const AnalysisConfig& config() const { return config_; }

private:
    AnalysisConfig config_;
};

} // namespace app
