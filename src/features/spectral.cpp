#include "features/spectral.hpp"
#include <algorithm>
#include <cmath>

namespace features {

namespace {
constexpr double kPi = 3.14159265358979323846;

// Direct DFT for sizes the radix-2 path cannot handle.
void dft(std::vector<std::complex<double>>& x, bool inverse) {
    const std::size_t N = x.size();
    const double sign = inverse ? 1.0 : -1.0;
    std::vector<std::complex<double>> out(N);
    for (std::size_t k = 0; k < N; ++k) {
        std::complex<double> acc(0.0, 0.0);
        for (std::size_t n = 0; n < N; ++n) {
            // (k*n) mod N keeps the angle small and the result exact for large N
            const double theta = sign * 2.0 * kPi * static_cast<double>((k * n) % N) / N;
            acc += x[n] * std::complex<double>(std::cos(theta), std::sin(theta));
        }
        out[k] = acc;
    }
    x.swap(out);
}
} // namespace

bool is_power_of_two(std::size_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

std::size_t next_power_of_two(std::size_t n) {
    std::size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

void fft_inplace(std::vector<std::complex<double>>& x, bool inverse) {
    const std::size_t N = x.size();
    if (N <= 1) return;
    if (!is_power_of_two(N)) {
        dft(x, inverse);
        return;
    }

    // Bit-reversal permutation
    std::size_t j = 0;
    for (std::size_t i = 0; i < N; ++i) {
        if (j > i) std::swap(x[i], x[j]);
        std::size_t m = N >> 1;
        while (m >= 1 && j >= m) { j -= m; m >>= 1; }
        j += m;
    }

    const double sign = inverse ? 1.0 : -1.0;
    std::vector<std::complex<double>> twiddle;
    for (std::size_t m = 2; m <= N; m <<= 1) {
        const std::size_t half = m / 2;
        // Twiddles from cos/sin directly; repeated multiplication drifts at n_fft=2048
        twiddle.resize(half);
        for (std::size_t t = 0; t < half; ++t) {
            const double theta = sign * 2.0 * kPi * static_cast<double>(t) / m;
            twiddle[t] = std::complex<double>(std::cos(theta), std::sin(theta));
        }
        for (std::size_t k = 0; k < N; k += m) {
            for (std::size_t t = 0; t < half; ++t) {
                const std::complex<double> u = x[k + t];
                const std::complex<double> v = twiddle[t] * x[k + t + half];
                x[k + t] = u + v;
                x[k + t + half] = u - v;
            }
        }
    }
}

std::vector<double> hann_window(std::size_t n) {
    std::vector<double> w(n, 1.0);
    if (n <= 1) return w;
    for (std::size_t i = 0; i < n; ++i) {
        w[i] = 0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) / static_cast<double>(n));
    }
    return w;
}

double hz_to_mel(double hz) {
    const double f_sp = 200.0 / 3.0;
    const double min_log_hz = 1000.0;
    const double min_log_mel = min_log_hz / f_sp;
    const double logstep = std::log(6.4) / 27.0;
    if (hz >= min_log_hz) {
        return min_log_mel + std::log(hz / min_log_hz) / logstep;
    }
    return hz / f_sp;
}

double mel_to_hz(double mel) {
    const double f_sp = 200.0 / 3.0;
    const double min_log_hz = 1000.0;
    const double min_log_mel = min_log_hz / f_sp;
    const double logstep = std::log(6.4) / 27.0;
    if (mel >= min_log_mel) {
        return min_log_hz * std::exp(logstep * (mel - min_log_mel));
    }
    return f_sp * mel;
}

std::vector<double> mel_filterbank(int sample_rate, int n_fft, int n_mels, double fmin, double fmax) {
    const int n_bins = n_fft / 2 + 1;
    std::vector<double> filters(static_cast<std::size_t>(n_mels) * n_bins, 0.0);

    std::vector<double> fft_freqs(n_bins);
    for (int k = 0; k < n_bins; ++k) {
        fft_freqs[k] = static_cast<double>(k) * sample_rate / n_fft;
    }

    // Band edges equally spaced on the mel scale
    const double mel_min = hz_to_mel(fmin);
    const double mel_max = hz_to_mel(fmax);
    std::vector<double> edges(n_mels + 2);
    for (int i = 0; i < n_mels + 2; ++i) {
        edges[i] = mel_to_hz(mel_min + (mel_max - mel_min) * i / (n_mels + 1));
    }

    for (int m = 0; m < n_mels; ++m) {
        const double left = edges[m];
        const double center = edges[m + 1];
        const double right = edges[m + 2];
        const double enorm = 2.0 / (right - left);
        for (int k = 0; k < n_bins; ++k) {
            const double down = (fft_freqs[k] - left) / (center - left);
            const double up = (right - fft_freqs[k]) / (right - center);
            filters[static_cast<std::size_t>(m) * n_bins + k] = std::max(0.0, std::min(down, up)) * enorm;
        }
    }
    return filters;
}

std::vector<double> dct_ii_ortho(const std::vector<double>& input, int n_coeffs) {
    std::vector<double> output(n_coeffs, 0.0);
    const std::size_t N = input.size();
    if (N == 0) return output;
    const double scale0 = std::sqrt(1.0 / N);
    const double scale = std::sqrt(2.0 / N);
    for (int k = 0; k < n_coeffs; ++k) {
        double sum = 0.0;
        for (std::size_t n = 0; n < N; ++n) {
            sum += input[n] * std::cos(kPi * k * (2.0 * n + 1.0) / (2.0 * N));
        }
        output[k] = sum * (k == 0 ? scale0 : scale);
    }
    return output;
}

FrameLayout::FrameLayout(std::size_t n_samples, std::size_t frame_length_, std::size_t hop_)
    : frame_length(frame_length_), hop(hop_), pad(frame_length_ / 2) {
    const std::size_t padded = n_samples + 2 * pad;
    n_frames = padded < frame_length ? 1 : 1 + (padded - frame_length) / hop;
}

void FrameLayout::copy_frame(const float* samples, std::size_t n_samples, std::size_t index,
                             std::vector<double>& out) const {
    out.assign(frame_length, 0.0);
    // Frame start in padded coordinates is index*hop; signal starts at `pad`
    const std::size_t start = index * hop;
    for (std::size_t i = 0; i < frame_length; ++i) {
        const std::size_t p = start + i;
        if (p < pad) continue;
        const std::size_t s = p - pad;
        if (s >= n_samples) break;
        out[i] = static_cast<double>(samples[s]);
    }
}

void power_spectrum(const std::vector<double>& frame, const std::vector<double>& window,
                    std::vector<double>& power_out) {
    const std::size_t n = frame.size();
    std::vector<std::complex<double>> buf(n);
    for (std::size_t i = 0; i < n; ++i) {
        buf[i] = std::complex<double>(frame[i] * window[i], 0.0);
    }
    fft_inplace(buf);
    const std::size_t n_bins = n / 2 + 1;
    power_out.resize(n_bins);
    for (std::size_t k = 0; k < n_bins; ++k) {
        power_out[k] = std::norm(buf[k]);
    }
}

} // namespace features
