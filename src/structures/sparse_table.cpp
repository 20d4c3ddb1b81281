#include "structures/sparse_table.h"

#include <algorithm>
#include <utility>

SparseTable::SparseTable(std::vector<double> vals) : RmqStructure(std::move(vals)) {
    n = values.size();

    lt.assign(n + 1, 0);
    for (size_t k = 2; k <= n; ++k)
        lt[k] = lt[k / 2] + 1;

    st.assign(lt[n] + 1, std::vector<double>(n, MIN_IDENTITY));
    build_table();
}

void SparseTable::build_table() {
    std::copy(values.begin(), values.end(), st[0].begin());

    for (size_t j = 1; (size_t{1} << j) <= n; ++j) {
        const size_t half = size_t{1} << (j - 1);
        const std::vector<double> &prev = st[j - 1];
        std::vector<double> &cur = st[j];
        for (size_t i = 0; i + (size_t{1} << j) <= n; ++i)
            cur[i] = std::min(prev[i], prev[i + half]);
    }
}

void SparseTable::do_update(size_t index, double value) {
    values[index] = value;
    build_table();
}

double SparseTable::do_query(size_t left, size_t right) const {
    size_t j = lt[right - left + 1];
    return std::min(st[j][left], st[j][right - (size_t{1} << j) + 1]);
}
