#pragma once
#include "audio/waveform.hpp"
#include <string>

namespace audio {

// Bounds the analysis expects from its callers.
struct ValidationLimits {
    double min_duration_s = 0.1;
    double max_duration_s = 60.0;
    float min_peak = 0.001f;     // below this peak |x| the clip counts as silent
};

enum class ValidationError {
    None,
    Empty,
    BadSampleRate,
    TooShort,
    TooLong,
    TooSilent,
    NonFinite
};

struct ValidationResult {
    ValidationError error = ValidationError::None;
    std::string message;
    double duration_s = 0.0;
    float peak = 0.0f;

    bool ok() const { return error == ValidationError::None; }
};

ValidationResult validate_waveform(const Waveform& waveform, const ValidationLimits& limits = ValidationLimits{});

} // namespace audio
