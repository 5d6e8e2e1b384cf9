#include "audio/resampler.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace convo {
namespace audio {

std::vector<float> RationalResampler::resample(const std::vector<float>& input, int inputRate,
                                               int outputRate) {
    if (inputRate <= 0 || outputRate <= 0) {
        throw std::invalid_argument("Sample rates must be positive (got " +
                                    std::to_string(inputRate) + " -> " +
                                    std::to_string(outputRate) + ")");
    }
    if (inputRate == outputRate || input.empty()) {
        return input;
    }

    const int divisor = std::gcd(inputRate, outputRate);
    const size_t up = static_cast<size_t>(outputRate / divisor);
    const size_t down = static_cast<size_t>(inputRate / divisor);

    const std::vector<double> filter = designFilter(up, down);
    const size_t taps = filter.size();
    const size_t delay = taps / 2;

    const size_t outputLength = (input.size() * up + down - 1) / down;
    std::vector<float> output(outputLength);

    for (size_t m = 0; m < outputLength; ++m) {
        // Position in the (virtual) upsampled stream, shifted by the filter delay
        const size_t t = m * down + delay;

        const size_t lastInput = std::min(input.size() - 1, t / up);
        const size_t firstInput = t >= taps - 1 ? (t - (taps - 1) + up - 1) / up : 0;

        double acc = 0.0;
        for (size_t n = firstInput; n <= lastInput; ++n) {
            acc += static_cast<double>(input[n]) * filter[t - n * up];
        }
        output[m] = static_cast<float>(acc);
    }

    return output;
}

std::vector<double> RationalResampler::designFilter(size_t up, size_t down) {
    const size_t maxFactor = std::max(up, down);
    const size_t halfLength = kHalfLengthPerFactor * maxFactor;
    const size_t taps = 2 * halfLength + 1;
    const double cutoff = 1.0 / static_cast<double>(maxFactor);
    const double windowNorm = besselI0(kKaiserBeta);

    std::vector<double> filter(taps);
    double sum = 0.0;
    for (size_t k = 0; k < taps; ++k) {
        const double x = static_cast<double>(k) - static_cast<double>(halfLength);
        const double arg = cutoff * x;
        const double sinc = (arg == 0.0) ? 1.0 : std::sin(M_PI * arg) / (M_PI * arg);

        const double ratio = 2.0 * static_cast<double>(k) / static_cast<double>(taps - 1) - 1.0;
        const double window = besselI0(kKaiserBeta * std::sqrt(std::max(0.0, 1.0 - ratio * ratio))) /
                              windowNorm;

        filter[k] = cutoff * sinc * window;
        sum += filter[k];
    }

    const double gain = static_cast<double>(up) / sum;
    for (double& coefficient : filter) {
        coefficient *= gain;
    }
    return filter;
}

double RationalResampler::besselI0(double x) {
    // Power series; converges quickly for the small beta used here
    double sum = 1.0;
    double term = 1.0;
    const double halfX = x / 2.0;
    for (int k = 1; k < 64; ++k) {
        term *= (halfX / k) * (halfX / k);
        sum += term;
        if (term < sum * 1e-16) {
            break;
        }
    }
    return sum;
}

} // namespace audio
} // namespace convo
