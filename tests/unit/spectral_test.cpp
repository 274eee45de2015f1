#include <cassert>
#include <cmath>
#include <complex>
#include <vector>
#include "features/spectral.hpp"

static bool near(double a, double b, double tol) { return std::fabs(a - b) <= tol; }

int main() {
    const double pi = 3.14159265358979323846;

    // Impulse -> flat spectrum
    {
        std::vector<std::complex<double>> x(16, 0.0);
        x[0] = 1.0;
        features::fft_inplace(x);
        for (const auto& v : x) assert(near(v.real(), 1.0, 1e-12) && near(v.imag(), 0.0, 1e-12));
    }
    // Forward then inverse recovers the input (scaled by N), power-of-two and not
    for (size_t n : {size_t(64), size_t(12)}) {
        std::vector<std::complex<double>> x(n), orig;
        for (size_t i = 0; i < n; ++i) x[i] = std::complex<double>(std::sin(0.3 * i), std::cos(0.7 * i));
        orig = x;
        features::fft_inplace(x);
        features::fft_inplace(x, true);
        for (size_t i = 0; i < n; ++i) {
            assert(near(x[i].real() / n, orig[i].real(), 1e-9));
            assert(near(x[i].imag() / n, orig[i].imag(), 1e-9));
        }
    }
    // A cosine at bin 3 puts N/2 in bins 3 and N-3
    {
        const size_t n = 12;
        std::vector<std::complex<double>> x(n);
        for (size_t i = 0; i < n; ++i) x[i] = std::cos(2.0 * pi * 3.0 * i / n);
        features::fft_inplace(x);
        assert(near(std::abs(x[3]), n / 2.0, 1e-9));
        assert(near(std::abs(x[n - 3]), n / 2.0, 1e-9));
        assert(near(std::abs(x[1]), 0.0, 1e-9));
    }

    assert(features::is_power_of_two(2048));
    assert(!features::is_power_of_two(1000));
    assert(features::next_power_of_two(1000) == 1024);

    // Periodic Hann
    {
        auto w = features::hann_window(4);
        assert(near(w[0], 0.0, 1e-12) && near(w[1], 0.5, 1e-12) && near(w[2], 1.0, 1e-12) && near(w[3], 0.5, 1e-12));
    }

    // Slaney mel scale: linear to 1 kHz (15 mel), log above
    assert(near(features::hz_to_mel(1000.0), 15.0, 1e-12));
    assert(near(features::hz_to_mel(200.0), 3.0, 1e-12));
    for (double hz : {60.0, 440.0, 4000.0, 11025.0}) {
        assert(near(features::mel_to_hz(features::hz_to_mel(hz)), hz, 1e-6));
    }

    // Filterbank: non-negative, every band covers at least one bin
    {
        const int n_fft = 2048, n_mels = 128, n_bins = n_fft / 2 + 1;
        auto fb = features::mel_filterbank(22050, n_fft, n_mels, 0.0, 11025.0);
        assert(fb.size() == static_cast<size_t>(n_mels * n_bins));
        for (int m = 0; m < n_mels; ++m) {
            double row = 0.0;
            for (int k = 0; k < n_bins; ++k) {
                assert(fb[m * n_bins + k] >= 0.0);
                row += fb[m * n_bins + k];
            }
            assert(row > 0.0);
        }
    }

    // DCT-II (orthonormal) of a constant: only c0 = value * sqrt(N)
    {
        std::vector<double> in(128, -100.0);
        auto c = features::dct_ii_ortho(in, 13);
        assert(c.size() == 13);
        assert(near(c[0], -100.0 * std::sqrt(128.0), 1e-9));
        for (size_t k = 1; k < c.size(); ++k) assert(near(c[k], 0.0, 1e-9));
    }

    // Centred framing
    {
        features::FrameLayout a(22050, 2048, 512);
        assert(a.n_frames == 44);
        assert(a.pad == 1024);
        features::FrameLayout b(100, 2048, 512);
        assert(b.n_frames == 1);

        std::vector<float> sig(3000, 1.0f);
        std::vector<double> frame;
        a.copy_frame(sig.data(), sig.size(), 0, frame);
        assert(frame.size() == 2048);
        assert(frame[1023] == 0.0 && frame[1024] == 1.0 && frame[2047] == 1.0);
        b.copy_frame(sig.data(), 100, 0, frame);
        assert(frame[1024] == 1.0 && frame[1123] == 1.0 && frame[1124] == 0.0);
    }

    // Power spectrum of a windowed bin-centred tone peaks at that bin
    {
        const size_t n = 1024;
        std::vector<double> frame(n);
        for (size_t i = 0; i < n; ++i) frame[i] = std::sin(2.0 * pi * 40.0 * i / n);
        std::vector<double> power;
        features::power_spectrum(frame, features::hann_window(n), power);
        assert(power.size() == n / 2 + 1);
        size_t peak = 0;
        for (size_t k = 1; k < power.size(); ++k) if (power[k] > power[peak]) peak = k;
        assert(peak == 40);
    }
    return 0;
}
