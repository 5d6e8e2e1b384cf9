#include "audio/wav_reader.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>

namespace convo {
namespace audio {

namespace {

constexpr uint16_t kFormatPcm = 0x0001;
constexpr uint16_t kFormatFloat = 0x0003;
constexpr uint16_t kFormatExtensible = 0xFFFE;

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

size_t bytesPerSample(WavSampleFormat format) {
    switch (format) {
        case WavSampleFormat::PCM_U8: return 1;
        case WavSampleFormat::PCM_16: return 2;
        case WavSampleFormat::PCM_24: return 3;
        case WavSampleFormat::PCM_32: return 4;
        case WavSampleFormat::FLOAT_32: return 4;
        case WavSampleFormat::FLOAT_64: return 8;
    }
    return 0;
}

WavSampleFormat resolveFormat(uint16_t formatTag, uint16_t bitsPerSample,
                              const std::string& source) {
    if (formatTag == kFormatPcm) {
        switch (bitsPerSample) {
            case 8: return WavSampleFormat::PCM_U8;
            case 16: return WavSampleFormat::PCM_16;
            case 24: return WavSampleFormat::PCM_24;
            case 32: return WavSampleFormat::PCM_32;
            default: break;
        }
    } else if (formatTag == kFormatFloat) {
        if (bitsPerSample == 32) {
            return WavSampleFormat::FLOAT_32;
        }
        if (bitsPerSample == 64) {
            return WavSampleFormat::FLOAT_64;
        }
    }
    throw utils::AudioLoadingException("Unsupported WAV encoding (format " +
                                           std::to_string(formatTag) + ", " +
                                           std::to_string(bitsPerSample) + " bits)",
                                       source);
}

} // namespace

float WavReader::decodeSample(const uint8_t* data, WavSampleFormat format) {
    switch (format) {
        case WavSampleFormat::PCM_U8:
            return (static_cast<float>(data[0]) - 128.0f) / 128.0f;
        case WavSampleFormat::PCM_16:
            return static_cast<float>(static_cast<int16_t>(readU16(data))) / 32768.0f;
        case WavSampleFormat::PCM_24: {
            int32_t value = static_cast<int32_t>(data[0] | (data[1] << 8) | (data[2] << 16));
            if (value & 0x800000) {
                value -= 0x1000000;
            }
            return static_cast<float>(value / 8388608.0);
        }
        case WavSampleFormat::PCM_32:
            return static_cast<float>(static_cast<int32_t>(readU32(data)) / 2147483648.0);
        case WavSampleFormat::FLOAT_32: {
            uint32_t bits = readU32(data);
            float value;
            std::memcpy(&value, &bits, sizeof(value));
            return value;
        }
        case WavSampleFormat::FLOAT_64: {
            uint64_t bits = static_cast<uint64_t>(readU32(data)) |
                            (static_cast<uint64_t>(readU32(data + 4)) << 32);
            double value;
            std::memcpy(&value, &bits, sizeof(value));
            return static_cast<float>(value);
        }
    }
    return 0.0f;
}

StereoAudio WavReader::loadStereo(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw utils::AudioLoadingException("Failed to open WAV file", path);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    StereoAudio audio = decodeStereo(bytes, path);

    utils::Logger::debug("Loaded " + path + ": " + std::to_string(audio.frameCount()) +
                         " frames at " + std::to_string(audio.sampleRate) + " Hz");
    return audio;
}

StereoAudio WavReader::decodeStereo(const std::vector<uint8_t>& bytes, const std::string& source) {
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        throw utils::AudioLoadingException("Not a RIFF/WAVE file", source);
    }

    bool haveFormat = false;
    uint16_t channels = 0;
    uint32_t sampleRate = 0;
    WavSampleFormat format = WavSampleFormat::PCM_16;
    const uint8_t* data = nullptr;
    size_t dataSize = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* header = bytes.data() + pos;
        const uint32_t chunkSize = readU32(header + 4);
        const size_t bodyStart = pos + 8;
        const size_t available = bytes.size() - bodyStart;

        if (std::memcmp(header, "fmt ", 4) == 0) {
            if (chunkSize < 16 || available < 16) {
                throw utils::AudioLoadingException("Truncated fmt chunk", source);
            }
            const uint8_t* fmt = bytes.data() + bodyStart;
            uint16_t formatTag = readU16(fmt);
            channels = readU16(fmt + 2);
            sampleRate = readU32(fmt + 4);
            const uint16_t bitsPerSample = readU16(fmt + 14);

            if (formatTag == kFormatExtensible) {
                if (chunkSize < 40 || available < 40) {
                    throw utils::AudioLoadingException("Truncated extensible fmt chunk", source);
                }
                // First two bytes of the sub-format GUID carry the real tag
                formatTag = readU16(fmt + 24);
            }
            format = resolveFormat(formatTag, bitsPerSample, source);
            haveFormat = true;
        } else if (std::memcmp(header, "data", 4) == 0) {
            data = bytes.data() + bodyStart;
            // Tolerate writers that leave the size field unset or too large
            dataSize = std::min<size_t>(chunkSize, available);
            break;
        }

        // Chunks are word aligned
        pos = bodyStart + chunkSize + (chunkSize & 1u);
    }

    if (!haveFormat) {
        throw utils::AudioLoadingException("Missing fmt chunk", source);
    }
    if (channels != 2) {
        throw utils::AudioLoadingException(
            "Expected stereo WAV (2 channels), got " + std::to_string(channels), source);
    }
    if (sampleRate == 0) {
        throw utils::AudioLoadingException("Invalid sample rate 0", source);
    }
    if (data == nullptr) {
        throw utils::AudioLoadingException("Missing data chunk", source);
    }

    const size_t sampleBytes = bytesPerSample(format);
    const size_t frameBytes = sampleBytes * 2;
    const size_t frames = dataSize / frameBytes;

    StereoAudio audio;
    audio.sampleRate = static_cast<int>(sampleRate);
    audio.left.resize(frames);
    audio.right.resize(frames);

    for (size_t i = 0; i < frames; ++i) {
        const uint8_t* frame = data + i * frameBytes;
        audio.left[i] = decodeSample(frame, format);
        audio.right[i] = decodeSample(frame + sampleBytes, format);
    }

    return audio;
}

} // namespace audio
} // namespace convo
