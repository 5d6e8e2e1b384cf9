#pragma once

#include <cstddef>
#include <vector>

namespace convo {
namespace audio {

/**
 * Polyphase rational resampler.
 *
 * The rate ratio is reduced to up/down, the signal is conceptually upsampled
 * by `up`, low-pass filtered with a Kaiser-windowed sinc and decimated by
 * `down`. Output length is ceil(n * up / down); matching rates return the
 * input unchanged.
 */
class RationalResampler {
public:
    static std::vector<float> resample(const std::vector<float>& input, int inputRate,
                                       int outputRate);

    // Low-pass prototype for the given factors, normalized to a DC gain of `up`.
    static std::vector<double> designFilter(size_t up, size_t down);

private:
    static constexpr size_t kHalfLengthPerFactor = 10;
    static constexpr double kKaiserBeta = 5.0;

    static double besselI0(double x);
};

} // namespace audio
} // namespace convo
