#include "utils/sort_utils.h"

#include <cmath>
#include <functional>
#include <numeric>
#include <stdexcept>

#include "ips4o/ips4o.hpp"

void SortUtils::sort_samples(std::vector<double> &samples) {
    ips4o::sort(samples.begin(), samples.end(), std::less<double>());
}

double SortUtils::percentile_sorted(const std::vector<double> &sorted, double p) {
    if (sorted.empty()) throw std::invalid_argument("percentile of an empty sample");
    if (p < 0.0 || p > 100.0) throw std::invalid_argument("percentile must be in [0, 100]");

    if (p == 0.0) return sorted.front();
    auto rank = static_cast<size_t>(std::ceil(p / 100.0 * static_cast<double>(sorted.size())));
    return sorted[rank - 1];
}

SampleSummary SortUtils::summarize(std::vector<double> samples) {
    if (samples.empty()) throw std::invalid_argument("summary of an empty sample");

    SampleSummary s;
    const auto count = static_cast<double>(samples.size());
    s.mean = std::accumulate(samples.begin(), samples.end(), 0.0) / count;

    double sq = 0.0;
    for (double v : samples) sq += (v - s.mean) * (v - s.mean);
    s.stddev = std::sqrt(sq / count);

    sort_samples(samples);
    s.median = percentile_sorted(samples, 50.0);
    return s;
}
