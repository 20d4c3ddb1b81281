#include "structures/sqrt_decomposition.h"

#include <algorithm>
#include <cmath>
#include <utility>

SqrtDecomposition::SqrtDecomposition(std::vector<double> vals) : RmqStructure(std::move(vals)) {
    n = values.size();

    // ceil(sqrt(n)) without trusting the rounding of std::sqrt
    block_size = static_cast<size_t>(std::sqrt(static_cast<double>(n)));
    while (block_size * block_size < n) ++block_size;
    while (block_size > 1 && (block_size - 1) * (block_size - 1) >= n) --block_size;

    num_blocks = (n + block_size - 1) / block_size;

    feed.assign(num_blocks, MIN_IDENTITY);
    for (size_t i = 0; i < n; ++i) {
        size_t b = i / block_size;
        feed[b] = std::min(feed[b], values[i]);
    }
}

void SqrtDecomposition::rebuild_block(size_t block) {
    size_t start = block * block_size;
    size_t end = std::min(start + block_size, n);

    double m = MIN_IDENTITY;
    for (size_t i = start; i < end; ++i)
        m = std::min(m, values[i]);
    feed[block] = m;
}

void SqrtDecomposition::do_update(size_t index, double value) {
    values[index] = value;
    rebuild_block(index / block_size);
}

double SqrtDecomposition::do_query(size_t left, size_t right) const {
    double res = MIN_IDENTITY;

    // head of a partially covered block
    while (left < right && left % block_size != 0) {
        res = std::min(res, values[left]);
        ++left;
    }

    // whole blocks
    while (left + block_size <= right + 1) {
        res = std::min(res, feed[left / block_size]);
        left += block_size;
    }

    // tail
    while (left <= right) {
        res = std::min(res, values[left]);
        ++left;
    }
    return res;
}
