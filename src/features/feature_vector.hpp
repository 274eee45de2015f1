#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace features {

/**
 * Acoustic fingerprint of one waveform.
 *
 * Produced once by extract() and consumed by detect::classify(). Every field has a
 * defined default so a partially filled record is still a valid classifier input.
 */
struct FeatureVector {
    std::vector<double> mfcc_mean;       // per-coefficient mean over frames
    std::vector<double> mfcc_var;        // per-coefficient population variance, >= 0
    double pitch_var = 0.0;              // f0 variance over voiced frames (Hz^2), 0 if none
    double spectral_flatness_mean = 0.0; // in [0, 1]
    double rms_var = 0.0;                // variance of per-frame RMS

    // Diagnostics, not used for classification
    int frame_count = 0;
    int voiced_frame_count = 0;
};

// Thrown only when the numeric transform cannot be computed on the given buffer.
class FeatureExtractionError : public std::runtime_error {
public:
    explicit FeatureExtractionError(const std::string& what)
        : std::runtime_error("Feature extraction failed: " + what) {}
};

} // namespace features
