#include "structures/naive.h"

#include <algorithm>
#include <utility>

NaiveRmq::NaiveRmq(std::vector<double> vals) : RmqStructure(std::move(vals)) {}

void NaiveRmq::do_update(size_t index, double value) {
    values[index] = value;
}

double NaiveRmq::do_query(size_t left, size_t right) const {
    double res = MIN_IDENTITY;
    for (size_t i = left; i <= right; ++i)
        res = std::min(res, values[i]);
    return res;
}
