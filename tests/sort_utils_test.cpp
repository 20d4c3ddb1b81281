#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "utils/sort_utils.h"

TEST(SortUtilsTest, SortsSamples) {
    std::vector<double> samples = {0.3, 0.1, 0.5, 0.2, 0.4};
    SortUtils::sort_samples(samples);
    EXPECT_EQ(samples, (std::vector<double>{0.1, 0.2, 0.3, 0.4, 0.5}));
}

TEST(SortUtilsTest, NearestRankPercentile) {
    std::vector<double> sorted = {1.0, 2.0, 3.0, 4.0};
    EXPECT_DOUBLE_EQ(SortUtils::percentile_sorted(sorted, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(SortUtils::percentile_sorted(sorted, 50.0), 2.0);
    EXPECT_DOUBLE_EQ(SortUtils::percentile_sorted(sorted, 75.0), 3.0);
    EXPECT_DOUBLE_EQ(SortUtils::percentile_sorted(sorted, 100.0), 4.0);
    EXPECT_THROW(SortUtils::percentile_sorted(sorted, 101.0), std::invalid_argument);
    EXPECT_THROW(SortUtils::percentile_sorted({}, 50.0), std::invalid_argument);
}

TEST(SortUtilsTest, Summary) {
    auto s = SortUtils::summarize({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
    EXPECT_DOUBLE_EQ(s.mean, 5.0);
    EXPECT_DOUBLE_EQ(s.stddev, 2.0);
    EXPECT_DOUBLE_EQ(s.median, 4.0);
    EXPECT_THROW(SortUtils::summarize({}), std::invalid_argument);
}
