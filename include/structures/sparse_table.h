#pragma once
#include "rmq_structure.h"

/**
 * Sparse table (binary lifting). st[j][i] holds the min of the 2^j elements
 * starting at i, for every level j <= floor(log2 N) and every i with
 * i + 2^j <= N. A query combines two (possibly overlapping) power-of-two
 * ranges, which is harmless for min.
 *
 * The table is static: an update rewrites the element and rebuilds every level.
 *
 * Build: O(N log N)
 * Update: O(N log N)
 * Query: O(1)
 */
class SparseTable : public RmqStructure {
public:
    explicit SparseTable(std::vector<double> vals);

    size_t levels() const { return st.size(); }

protected:
    void do_update(size_t index, double value) override;

    double do_query(size_t left, size_t right) const override;

private:
    size_t n = 0;
    std::vector<size_t> lt; // lt[k] = floor(log2(k)), lt[0] = lt[1] = 0
    std::vector<std::vector<double>> st;

    void build_table();
};
