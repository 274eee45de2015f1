#pragma once
#include "audio/waveform.hpp"
#include <cstddef>
#include <string>

namespace audio {

// Decode a PCM or IEEE-float WAV file, averaging channels down to mono.
// Keeps the file's native sample rate. Returns false if the file cannot be decoded
// or holds no samples.
bool read_wav_mono(const std::string& path, Waveform& out);

// Same as above for an in-memory WAV image.
bool read_wav_mono_memory(const void* data, size_t size, Waveform& out);

} // namespace audio
