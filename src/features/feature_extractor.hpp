#pragma once

#include "features/feature_vector.hpp"
#include "features/pitch_tracker.hpp"
#include <cstddef>
#include <vector>

namespace features {

/**
 * Analysis parameters. The defaults reproduce the numeric ranges the decision
 * thresholds were calibrated against (2048/512 framing, 128 Slaney mel bands, 80 dB floor).
 */
struct ExtractorConfig {
    int n_fft = 2048;              // spectral frame length (samples)
    int hop_length = 512;
    int n_mels = 128;
    double fmin = 0.0;
    double fmax = 0.0;             // 0 = Nyquist
    double amin = 1e-10;           // power floor before log
    double top_db = 80.0;          // dynamic range kept below the spectrogram peak; <= 0 disables
    double flatness_power = 2.0;   // exponent on |X| for spectral flatness (2 = power spectrum)
    PitchTracker::Config pitch;
};

constexpr int kDefaultCoefficientCount = 13;

/**
 * Turn a mono waveform into a FeatureVector.
 *
 * Pure and re-entrant: no shared state, identical input gives bit-identical output.
 * Silence and pure tones produce valid features.
 *
 * @param samples Mono samples, roughly in [-1, 1]
 * @param n_samples Number of samples, must be > 0
 * @param sample_rate Native sample rate in Hz
 * @param coefficient_count Number of cepstral coefficients, 1..n_mels
 * @throws FeatureExtractionError when the transform cannot be computed
 */
FeatureVector extract(const float* samples, std::size_t n_samples, int sample_rate,
                      int coefficient_count = kDefaultCoefficientCount,
                      const ExtractorConfig& config = ExtractorConfig{});

FeatureVector extract(const std::vector<float>& waveform, int sample_rate,
                      int coefficient_count = kDefaultCoefficientCount,
                      const ExtractorConfig& config = ExtractorConfig{});

// Population mean / variance (divide by n). Both return 0 for empty input.
double mean_of(const std::vector<double>& v);
double variance_of(const std::vector<double>& v);

} // namespace features
