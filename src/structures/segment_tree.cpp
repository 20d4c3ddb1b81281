#include "structures/segment_tree.h"

#include <algorithm>
#include <utility>

SegmentTree::SegmentTree(std::vector<double> vals) : RmqStructure(std::move(vals)) {
    n = values.size();
    seg_tree.assign(4 * n, MIN_IDENTITY);
    build_node(0, 0, n - 1);
}

void SegmentTree::build_node(size_t node, size_t start, size_t end) {
    if (start == end) {
        seg_tree[node] = values[start];
        return;
    }

    size_t mid = (start + end) / 2;
    build_node(seg_left(node), start, mid);
    build_node(seg_right(node), mid + 1, end);
    seg_tree[node] = std::min(seg_tree[seg_left(node)], seg_tree[seg_right(node)]);
}

void SegmentTree::do_update(size_t index, double value) {
    update_node(0, 0, n - 1, index, value);
}

void SegmentTree::update_node(size_t node, size_t start, size_t end, size_t index, double value) {
    if (start == end) {
        values[index] = value;
        seg_tree[node] = value;
        return;
    }

    size_t mid = (start + end) / 2;
    if (index <= mid)
        update_node(seg_left(node), start, mid, index, value);
    else
        update_node(seg_right(node), mid + 1, end, index, value);

    seg_tree[node] = std::min(seg_tree[seg_left(node)], seg_tree[seg_right(node)]);
}

double SegmentTree::do_query(size_t left, size_t right) const {
    return query_node(0, 0, n - 1, left, right);
}

double SegmentTree::query_node(size_t node, size_t start, size_t end, size_t left, size_t right) const {
    // disjoint
    if (right < start || end < left) return MIN_IDENTITY;

    // fully covered
    if (left <= start && end <= right) return seg_tree[node];

    size_t mid = (start + end) / 2;
    double q1 = query_node(seg_left(node), start, mid, left, right);
    double q2 = query_node(seg_right(node), mid + 1, end, left, right);
    return std::min(q1, q2);
}
