#pragma once
#include "rmq_structure.h"

/**
 * Recursive segment tree over a flat buffer.
 *
 * Node k covers [start, end]; its children are 2k+1 (covering [start, mid])
 * and 2k+2 (covering [mid+1, end]) with mid = (start + end) / 2. Every
 * internal node holds the min of its children, every leaf its element.
 *
 * Build: O(N)
 * Update: O(log N), repairs one root-to-leaf path
 * Query: O(log N)
 */
class SegmentTree : public RmqStructure {
public:
    explicit SegmentTree(std::vector<double> vals);

protected:
    void do_update(size_t index, double value) override;

    double do_query(size_t left, size_t right) const override;

private:
    // 4N slots are enough for any N with this layout
    std::vector<double> seg_tree;
    size_t n = 0;

    inline size_t seg_left(size_t node) const { return 2 * node + 1; }
    inline size_t seg_right(size_t node) const { return 2 * node + 2; }

    void build_node(size_t node, size_t start, size_t end);

    void update_node(size_t node, size_t start, size_t end, size_t index, double value);

    double query_node(size_t node, size_t start, size_t end, size_t left, size_t right) const;
};
