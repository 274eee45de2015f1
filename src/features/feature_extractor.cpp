#include "features/feature_extractor.hpp"
#include "features/spectral.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace features {

double mean_of(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double sum = 0.0;
    for (double x : v) sum += x;
    return sum / static_cast<double>(v.size());
}

double variance_of(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    const double mean = mean_of(v);
    double acc = 0.0;
    for (double x : v) acc += (x - mean) * (x - mean);
    return acc / static_cast<double>(v.size());
}

namespace {

void check_inputs(const float* samples, std::size_t n_samples, int sample_rate,
                  int coefficient_count, const ExtractorConfig& config) {
    if (!samples || n_samples == 0) {
        throw FeatureExtractionError("empty waveform");
    }
    if (sample_rate <= 0) {
        throw FeatureExtractionError("sample rate must be positive, got " + std::to_string(sample_rate));
    }
    if (config.n_fft <= 0 || config.hop_length <= 0 || config.n_mels <= 0) {
        throw FeatureExtractionError("n_fft, hop_length and n_mels must be positive");
    }
    if (coefficient_count < 1 || coefficient_count > config.n_mels) {
        throw FeatureExtractionError("coefficient count " + std::to_string(coefficient_count) +
                                     " outside [1, " + std::to_string(config.n_mels) + "]");
    }
    for (std::size_t i = 0; i < n_samples; ++i) {
        if (!std::isfinite(samples[i])) {
            throw FeatureExtractionError("waveform is not finite at sample " + std::to_string(i));
        }
    }
}

} // namespace

FeatureVector extract(const float* samples, std::size_t n_samples, int sample_rate,
                      int coefficient_count, const ExtractorConfig& config) {
    check_inputs(samples, n_samples, sample_rate, coefficient_count, config);

    const double fmax = config.fmax > 0.0 ? config.fmax : sample_rate / 2.0;
    if (config.fmin < 0.0 || config.fmin >= fmax) {
        throw FeatureExtractionError("mel band requires 0 <= fmin < fmax");
    }

    // Validates the pitch band against the sample rate before any heavy work
    const PitchTracker tracker(sample_rate, config.pitch);

    const FrameLayout layout(n_samples, static_cast<std::size_t>(config.n_fft),
                             static_cast<std::size_t>(config.hop_length));
    const std::size_t n_frames = layout.n_frames;
    const int n_bins = config.n_fft / 2 + 1;
    const int n_mels = config.n_mels;

    const std::vector<double> window = hann_window(static_cast<std::size_t>(config.n_fft));
    const std::vector<double> filters = mel_filterbank(sample_rate, config.n_fft, n_mels, config.fmin, fmax);

    std::vector<double> mel_db(n_frames * n_mels);
    std::vector<double> flatness(n_frames);
    std::vector<double> rms(n_frames);
    double peak_db = -std::numeric_limits<double>::infinity();

    std::vector<double> frame;
    std::vector<double> power;
    for (std::size_t f = 0; f < n_frames; ++f) {
        layout.copy_frame(samples, n_samples, f, frame);

        double sq = 0.0;
        for (double x : frame) sq += x * x;
        rms[f] = std::sqrt(sq / static_cast<double>(frame.size()));

        power_spectrum(frame, window, power);

        // Geometric over arithmetic mean of the floored spectrum
        double log_sum = 0.0, lin_sum = 0.0;
        for (int k = 0; k < n_bins; ++k) {
            const double s = std::max(config.amin, std::pow(power[k], config.flatness_power / 2.0));
            log_sum += std::log(s);
            lin_sum += s;
        }
        const double gmean = std::exp(log_sum / n_bins);
        const double amean = lin_sum / n_bins;
        flatness[f] = std::min(1.0, std::max(0.0, gmean / amean));

        for (int m = 0; m < n_mels; ++m) {
            const double* w = filters.data() + static_cast<std::size_t>(m) * n_bins;
            double e = 0.0;
            for (int k = 0; k < n_bins; ++k) e += w[k] * power[k];
            const double db = 10.0 * std::log10(std::max(config.amin, e));
            mel_db[f * n_mels + m] = db;
            peak_db = std::max(peak_db, db);
        }
    }

    if (config.top_db > 0.0) {
        const double floor_db = peak_db - config.top_db;
        for (double& v : mel_db) v = std::max(v, floor_db);
    }

    std::vector<std::vector<double>> cepstra(coefficient_count, std::vector<double>(n_frames));
    std::vector<double> row(n_mels);
    for (std::size_t f = 0; f < n_frames; ++f) {
        std::copy(mel_db.begin() + f * n_mels, mel_db.begin() + (f + 1) * n_mels, row.begin());
        const std::vector<double> c = dct_ii_ortho(row, coefficient_count);
        for (int i = 0; i < coefficient_count; ++i) cepstra[i][f] = c[i];
    }

    FeatureVector fv;
    fv.mfcc_mean.resize(coefficient_count);
    fv.mfcc_var.resize(coefficient_count);
    for (int i = 0; i < coefficient_count; ++i) {
        fv.mfcc_mean[i] = mean_of(cepstra[i]);
        fv.mfcc_var[i] = variance_of(cepstra[i]);
    }

    const PitchTrack track = tracker.track(samples, n_samples);
    std::vector<double> voiced_f0;
    voiced_f0.reserve(track.f0.size());
    for (std::size_t f = 0; f < track.f0.size(); ++f) {
        if (track.voiced[f]) voiced_f0.push_back(track.f0[f]);
    }
    // Unvoiced frames are undefined, not zero: they never enter the statistic
    fv.pitch_var = variance_of(voiced_f0);

    fv.spectral_flatness_mean = std::min(1.0, std::max(0.0, mean_of(flatness)));
    fv.rms_var = variance_of(rms);
    fv.frame_count = static_cast<int>(n_frames);
    fv.voiced_frame_count = static_cast<int>(voiced_f0.size());
    return fv;
}

FeatureVector extract(const std::vector<float>& waveform, int sample_rate,
                      int coefficient_count, const ExtractorConfig& config) {
    return extract(waveform.data(), waveform.size(), sample_rate, coefficient_count, config);
}

} // namespace features
