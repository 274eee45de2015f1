#pragma once

#include <complex>
#include <cstddef>
#include <vector>

namespace features {

// In-place FFT. Radix-2 Cooley-Tukey for power-of-two sizes, direct DFT otherwise.
// inverse=true computes the unscaled inverse transform.
void fft_inplace(std::vector<std::complex<double>>& x, bool inverse = false);

bool is_power_of_two(std::size_t n);
std::size_t next_power_of_two(std::size_t n);

// Periodic Hann window of length n (the DFT-even form used for spectral analysis).
std::vector<double> hann_window(std::size_t n);

// Slaney mel scale: linear below 1 kHz, logarithmic above.
double hz_to_mel(double hz);
double mel_to_hz(double mel);

/**
 * Triangular mel filterbank with Slaney area normalisation.
 * @return Row-major matrix [n_mels x (n_fft/2 + 1)]
 */
std::vector<double> mel_filterbank(int sample_rate, int n_fft, int n_mels, double fmin, double fmax);

// Orthonormal DCT-II of input, first n_coeffs outputs.
std::vector<double> dct_ii_ortho(const std::vector<double>& input, int n_coeffs);

/**
 * Centred framing: the signal is conceptually zero padded by frame_length/2 on both
 * sides and cut into frames every hop samples.
 */
struct FrameLayout {
    std::size_t frame_length = 0;
    std::size_t hop = 0;
    std::size_t pad = 0;       // zeros added in front
    std::size_t n_frames = 0;

    FrameLayout(std::size_t n_samples, std::size_t frame_length, std::size_t hop);

    // Copies frame `index` into out (resized to frame_length), zeros outside the signal.
    void copy_frame(const float* samples, std::size_t n_samples, std::size_t index,
                    std::vector<double>& out) const;
};

// Power spectrum |X[k]|^2 of one windowed frame, k = 0..n/2.
void power_spectrum(const std::vector<double>& frame, const std::vector<double>& window,
                    std::vector<double>& power_out);

} // namespace features
