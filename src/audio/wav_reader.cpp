// WAV decoding via dr_wav (dr_libs)
#include "audio/wav_reader.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

namespace audio {

namespace {
bool decode(drwav& wav, Waveform& out) {
    const uint64_t n = wav.totalPCMFrameCount;
    const unsigned channels = wav.channels;
    if (n == 0 || channels == 0 || wav.sampleRate == 0) {
        drwav_uninit(&wav);
        return false;
    }

    std::vector<float> interleaved(static_cast<size_t>(n) * channels);
    const uint64_t read = drwav_read_pcm_frames_f32(&wav, n, interleaved.data());
    const int sample_rate = static_cast<int>(wav.sampleRate);
    drwav_uninit(&wav);
    if (read == 0) return false;

    // Convert to mono if stereo
    out.samples.resize(static_cast<size_t>(read));
    if (channels == 1) {
        std::copy(interleaved.begin(), interleaved.begin() + static_cast<std::ptrdiff_t>(read), out.samples.begin());
    } else {
        for (uint64_t i = 0; i < read; ++i) {
            float sum = 0.0f;
            for (unsigned c = 0; c < channels; ++c) {
                sum += interleaved[i * channels + c];
            }
            out.samples[i] = sum / static_cast<float>(channels);
        }
    }
    out.sample_rate = sample_rate;
    if (read < n) {
        core::log_warn("WAV data truncated: read " + std::to_string(read) + " of " + std::to_string(n) + " frames");
    }
    return true;
}
} // namespace

bool read_wav_mono(const std::string& path, Waveform& out) {
    out = Waveform{};
    drwav wav;
    if (!drwav_init_file(&wav, path.c_str(), nullptr)) {
        core::log_error("cannot open WAV: " + path);
        return false;
    }
    if (!decode(wav, out)) {
        core::log_error("no audio frames in WAV: " + path);
        return false;
    }
    core::log_debug(path + ": " + std::to_string(out.samples.size()) + " samples @ " +
                    std::to_string(out.sample_rate) + " Hz");
    return true;
}

bool read_wav_mono_memory(const void* data, size_t size, Waveform& out) {
    out = Waveform{};
    drwav wav;
    if (!drwav_init_memory(&wav, data, size, nullptr)) {
        core::log_error("cannot parse in-memory WAV");
        return false;
    }
    return decode(wav, out);
}

} // namespace audio
