#pragma once
#include "rmq_structure.h"

/**
 * Square root decomposition: ceil(N / block_size) contiguous blocks of
 * block_size = ceil(sqrt(N)) elements, feed[b] holding the min of block b.
 *
 * An update rescans the owning block, so feed[b] can rise as well as fall.
 *
 * Update: O(sqrt N)
 * Query: O(sqrt N)
 */
class SqrtDecomposition : public RmqStructure {
public:
    explicit SqrtDecomposition(std::vector<double> vals);

    size_t get_block_size() const { return block_size; }
    size_t get_num_blocks() const { return num_blocks; }

protected:
    void do_update(size_t index, double value) override;

    double do_query(size_t left, size_t right) const override;

private:
    size_t n = 0;
    size_t block_size = 0;
    size_t num_blocks = 0;
    std::vector<double> feed; // min per block

    void rebuild_block(size_t block);
};
