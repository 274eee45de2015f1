#include "audio/waveform_validator.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace audio {

namespace {
std::string seconds(double s) {
    std::ostringstream os;
    os << s << "s";
    return os.str();
}
} // namespace

ValidationResult validate_waveform(const Waveform& waveform, const ValidationLimits& limits) {
    ValidationResult r;
    if (waveform.samples.empty()) {
        r.error = ValidationError::Empty;
        r.message = "Audio contains no samples";
        return r;
    }
    if (waveform.sample_rate <= 0) {
        r.error = ValidationError::BadSampleRate;
        r.message = "Invalid sample rate: " + std::to_string(waveform.sample_rate);
        return r;
    }

    r.duration_s = waveform.duration_seconds();
    if (r.duration_s < limits.min_duration_s) {
        r.error = ValidationError::TooShort;
        r.message = "Audio is too short (min " + seconds(limits.min_duration_s) + ")";
        return r;
    }
    if (r.duration_s > limits.max_duration_s) {
        r.error = ValidationError::TooLong;
        r.message = "Audio is too long (max " + seconds(limits.max_duration_s) + ")";
        return r;
    }

    for (float x : waveform.samples) {
        if (!std::isfinite(x)) {
            r.error = ValidationError::NonFinite;
            r.message = "Audio contains non-finite samples";
            return r;
        }
        r.peak = std::max(r.peak, std::fabs(x));
    }
    if (r.peak < limits.min_peak) {
        r.error = ValidationError::TooSilent;
        r.message = "Audio is too silent";
        return r;
    }
    return r;
}

} // namespace audio
