#include "features/pitch_tracker.hpp"
#include "features/feature_vector.hpp"
#include "features/spectral.hpp"
#include <algorithm>
#include <cmath>
#include <complex>
#include <string>

namespace features {

namespace {

// Regularised incomplete beta I_x(a, b) for integer a, b >= 1:
// 1 - sum_{j<a} C(n, j) x^j (1-x)^(n-j), n = a + b - 1.
double beta_cdf(double x, int a, int b) {
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;
    const int n = a + b - 1;
    double sum = 0.0;
    double binom = 1.0;
    for (int j = 0; j < a; ++j) {
        sum += binom * std::pow(x, j) * std::pow(1.0 - x, n - j);
        binom = binom * (n - j) / (j + 1);
    }
    return std::min(1.0, std::max(0.0, 1.0 - sum));
}

// Truncated geometric (Boltzmann) pmf over trough rank k of n troughs.
double boltzmann_pmf(int k, double lambda, int n) {
    return (1.0 - std::exp(-lambda)) * std::exp(-lambda * k) / (1.0 - std::exp(-lambda * n));
}

} // namespace

int PitchTrack::voiced_count() const {
    return static_cast<int>(std::count(voiced.begin(), voiced.end(), true));
}

PitchTracker::PitchTracker(int sample_rate) : PitchTracker(sample_rate, Config()) {}

PitchTracker::PitchTracker(int sample_rate, const Config& config)
    : m_config(config), m_sample_rate(sample_rate) {
    if (sample_rate <= 0) {
        throw FeatureExtractionError("sample rate must be positive, got " + std::to_string(sample_rate));
    }
    if (config.frame_length <= 0 || config.hop_length <= 0) {
        throw FeatureExtractionError("pitch frame and hop length must be positive");
    }
    if (!(config.fmin > 0.0) || !(config.fmax > config.fmin)) {
        throw FeatureExtractionError("pitch band requires 0 < fmin < fmax");
    }
    if (config.n_thresholds <= 0 || config.beta_a < 1 || config.beta_b < 1) {
        throw FeatureExtractionError("invalid pitch threshold prior");
    }
    m_win_length = config.win_length > 0 ? config.win_length : config.frame_length / 2;
    if (m_win_length <= 0 || m_win_length >= config.frame_length) {
        throw FeatureExtractionError("pitch window must be shorter than the pitch frame");
    }

    m_min_period = std::max(1, static_cast<int>(std::floor(sample_rate / config.fmax)));
    // Longest usable lag is bounded by the samples left after the comparison window
    m_max_period = std::min(static_cast<int>(std::ceil(sample_rate / config.fmin)),
                            config.frame_length - m_win_length - 1);
    if (m_max_period - m_min_period < 2) {
        throw FeatureExtractionError("pitch band " + std::to_string(config.fmin) + "-" +
                                     std::to_string(config.fmax) + " Hz cannot be resolved at " +
                                     std::to_string(sample_rate) + " Hz with a " +
                                     std::to_string(config.frame_length) + "-sample frame");
    }

    m_beta_probs.resize(config.n_thresholds);
    double prev = 0.0;
    for (int j = 0; j < config.n_thresholds; ++j) {
        const double cdf = beta_cdf(static_cast<double>(j + 1) / config.n_thresholds, config.beta_a, config.beta_b);
        m_beta_probs[j] = cdf - prev;
        prev = cdf;
    }
}

void PitchTracker::analyze_frame(const std::vector<double>& frame, double& f0, double& voiced_prob) const {
    f0 = 0.0;
    voiced_prob = 0.0;

    const int FL = static_cast<int>(frame.size());
    const int W = m_win_length;

    // Sliding window energies e(tau) = sum_{j<W} x[j+tau]^2
    std::vector<double> cum_sq(FL + 1, 0.0);
    for (int i = 0; i < FL; ++i) cum_sq[i + 1] = cum_sq[i] + frame[i] * frame[i];
    auto energy = [&](int tau) { return cum_sq[tau + W] - cum_sq[tau]; };

    const double e0 = energy(0);
    if (e0 <= m_config.silence_energy) return;

    // Cross-correlation of the first W samples with the frame, via FFT
    const std::size_t N = next_power_of_two(static_cast<std::size_t>(FL));
    std::vector<std::complex<double>> a(N), b(N);
    for (int i = 0; i < FL; ++i) a[i] = frame[i];
    for (int i = 0; i < W; ++i) b[i] = frame[i];
    fft_inplace(a);
    fft_inplace(b);
    for (std::size_t k = 0; k < N; ++k) a[k] *= std::conj(b[k]);
    fft_inplace(a, true);

    // Difference function and cumulative mean normalisation, tau = 1..max_period
    const int max_p = m_max_period;
    std::vector<double> yin(max_p + 1, 1.0);
    double running = 0.0;
    for (int tau = 1; tau <= max_p; ++tau) {
        const double acf = a[tau].real() / static_cast<double>(N);
        const double d = std::max(0.0, e0 + energy(tau) - 2.0 * acf);
        running += d;
        yin[tau] = running > 0.0 ? d * tau / running : 1.0;
    }

    // Candidate lags [min_period, max_period]
    const int L = max_p - m_min_period + 1;
    const double* y = yin.data() + m_min_period;

    std::vector<double> shift(L, 0.0);
    for (int i = 1; i < L - 1; ++i) {
        const double curv = y[i + 1] + y[i - 1] - 2.0 * y[i];
        const double slope = (y[i + 1] - y[i - 1]) / 2.0;
        if (std::abs(slope) < std::abs(curv)) shift[i] = -slope / curv;
    }

    std::vector<int> troughs;
    if (y[0] < y[1]) troughs.push_back(0);
    for (int i = 1; i < L - 1; ++i) {
        if (y[i - 1] > y[i] && y[i] <= y[i + 1]) troughs.push_back(i);
    }
    if (troughs.empty()) return;

    const int n_thr = m_config.n_thresholds;
    std::vector<double> probs(troughs.size(), 0.0);
    for (int j = 0; j < n_thr; ++j) {
        const double thr = static_cast<double>(j + 1) / n_thr;
        int below = 0;
        for (int t : troughs) if (y[t] < thr) ++below;
        if (below == 0) continue;
        int rank = 0;
        for (std::size_t t = 0; t < troughs.size(); ++t) {
            if (y[troughs[t]] < thr) {
                probs[t] += m_beta_probs[j] * boltzmann_pmf(rank, m_config.boltzmann_parameter, below);
                ++rank;
            }
        }
    }

    // The deepest trough also collects the "no trough below threshold" mass
    std::size_t global_min = 0;
    for (std::size_t t = 1; t < troughs.size(); ++t) {
        if (y[troughs[t]] < y[troughs[global_min]]) global_min = t;
    }
    double mass_above = 0.0;
    for (int j = 0; j < n_thr; ++j) {
        if (!(y[troughs[global_min]] < static_cast<double>(j + 1) / n_thr)) mass_above += m_beta_probs[j];
    }
    probs[global_min] += m_config.no_trough_probability * mass_above;

    std::size_t best = 0;
    double total = 0.0;
    for (std::size_t t = 0; t < probs.size(); ++t) {
        total += probs[t];
        if (probs[t] > probs[best]) best = t;
    }
    voiced_prob = std::min(1.0, total);

    const int i = troughs[best];
    const double period = m_min_period + i + shift[i];
    if (period > 0.0) f0 = static_cast<double>(m_sample_rate) / period;
}

PitchTrack PitchTracker::track(const float* samples, std::size_t n_samples) const {
    const FrameLayout layout(n_samples, static_cast<std::size_t>(m_config.frame_length),
                             static_cast<std::size_t>(m_config.hop_length));
    PitchTrack out;
    out.f0.assign(layout.n_frames, 0.0);
    out.voiced_probability.assign(layout.n_frames, 0.0);
    out.voiced.assign(layout.n_frames, false);

    std::vector<double> frame;
    for (std::size_t f = 0; f < layout.n_frames; ++f) {
        layout.copy_frame(samples, n_samples, f, frame);
        double f0 = 0.0, prob = 0.0;
        analyze_frame(frame, f0, prob);
        if (f0 > 0.0 && prob >= m_config.voiced_threshold) {
            out.f0[f] = f0;
            out.voiced[f] = true;
        }
        out.voiced_probability[f] = prob;
    }
    return out;
}

} // namespace features
