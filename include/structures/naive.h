#pragma once
#include "rmq_structure.h"

// Linear scan over the range; O(1) update, O(r - l + 1) query.
class NaiveRmq : public RmqStructure {
public:
    explicit NaiveRmq(std::vector<double> vals);

protected:
    void do_update(size_t index, double value) override;

    double do_query(size_t left, size_t right) const override;
};
