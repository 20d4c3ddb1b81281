#pragma once

#include <vector>

struct SampleSummary {
    double mean = 0.0;
    double stddev = 0.0; // population standard deviation
    double median = 0.0;
};

class SortUtils {
public:
    static void sort_samples(std::vector<double> &samples);

    // Nearest-rank percentile of already sorted samples, p in [0, 100]
    static double percentile_sorted(const std::vector<double> &sorted, double p);

    static SampleSummary summarize(std::vector<double> samples);
};
