#include "analysis/conversation_types.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace convo {
namespace analysis {

DistributionSummary DistributionSummary::summarize(const std::vector<double>& samples) {
    DistributionSummary summary;
    if (samples.empty()) {
        return summary;
    }

    std::vector<double> sorted = samples;
    std::sort(sorted.begin(), sorted.end());

    const size_t n = sorted.size();
    summary.count = n;
    summary.min = sorted.front();
    summary.max = sorted.back();
    summary.mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(n);
    summary.median = (n % 2 == 1) ? sorted[n / 2] : (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;

    double squares = 0.0;
    for (double value : sorted) {
        const double diff = value - summary.mean;
        squares += diff * diff;
    }
    summary.stddev = std::sqrt(squares / static_cast<double>(n));

    return summary;
}

} // namespace analysis
} // namespace convo
