#pragma once
#include <vector>

namespace audio {

// Mono samples in [-1, 1] at the source's native rate.
struct Waveform {
    std::vector<float> samples;
    int sample_rate = 0;

    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

} // namespace audio
