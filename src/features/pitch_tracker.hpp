#pragma once

#include <cstddef>
#include <vector>

namespace features {

// Per-frame output of the pitch tracker. f0 is 0.0 for unvoiced frames.
struct PitchTrack {
    std::vector<double> f0;
    std::vector<double> voiced_probability;
    std::vector<bool> voiced;

    int voiced_count() const;
};

/**
 * Probabilistic YIN pitch tracker (first, per-frame stage of pYIN).
 *
 * Each frame yields f0 candidates from the troughs of the cumulative mean normalised
 * difference function. Candidates are weighted by a Beta prior over YIN thresholds and a
 * Boltzmann prior favouring earlier troughs; their summed weight is the frame's voiced
 * probability. Frames are centred and zero padded like the spectral frames.
 */
class PitchTracker {
public:
    struct Config {
        double fmin = 65.40639132514966;    // C2
        double fmax = 2093.004522404789;    // C7
        int frame_length = 2048;
        int hop_length = 512;
        int win_length = 0;                 // 0 = frame_length / 2
        int n_thresholds = 100;
        int beta_a = 2;                     // Beta(a, b) prior over thresholds
        int beta_b = 18;
        double boltzmann_parameter = 2.0;
        double no_trough_probability = 0.01;
        double voiced_threshold = 0.5;      // voiced when summed probability reaches this
        double silence_energy = 1e-10;      // window energy at or below this is unvoiced
    };

    // Both throw FeatureExtractionError when the band cannot be analysed at sample_rate.
    explicit PitchTracker(int sample_rate);
    PitchTracker(int sample_rate, const Config& config);

    PitchTrack track(const float* samples, std::size_t n_samples) const;

    int min_period() const { return m_min_period; }
    int max_period() const { return m_max_period; }

private:
    Config m_config;
    int m_sample_rate;
    int m_win_length;
    int m_min_period;   // shortest lag searched (samples)
    int m_max_period;   // longest lag searched (samples)
    std::vector<double> m_beta_probs;  // prior mass per threshold bin

    void analyze_frame(const std::vector<double>& frame, double& f0, double& voiced_prob) const;
};

} // namespace features
