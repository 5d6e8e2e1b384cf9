#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace convo {
namespace audio {

// Both channels of a stereo recording, normalized to [-1, 1]
struct StereoAudio {
    int sampleRate = 0;
    std::vector<float> left;
    std::vector<float> right;

    size_t frameCount() const { return left.size(); }
    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(left.size()) / sampleRate : 0.0;
    }
};

enum class WavSampleFormat {
    PCM_U8,
    PCM_16,
    PCM_24,
    PCM_32,
    FLOAT_32,
    FLOAT_64
};

/**
 * RIFF/WAVE reader for two-channel recordings. Integer PCM is scaled by its
 * full-scale value (8-bit is offset by 128 first); float data is kept as is.
 * Anything but exactly two channels, or an unsupported encoding, throws
 * AudioLoadingException.
 */
class WavReader {
public:
    static StereoAudio loadStereo(const std::string& path);
    static StereoAudio decodeStereo(const std::vector<uint8_t>& bytes,
                                    const std::string& source = "<memory>");

    static float decodeSample(const uint8_t* data, WavSampleFormat format);
};

} // namespace audio
} // namespace convo
