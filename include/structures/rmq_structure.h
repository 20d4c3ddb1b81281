#pragma once
#include <cstdint>
#include <limits>
#include <string>
#include <variant>
#include <vector>

#include "rmq_errors.h"

// A value whose kind is only known at run time (parsed dataset cells, scripted operations)
using Cell = std::variant<int64_t, double, std::string>;

// Identity element of min
inline constexpr double MIN_IDENTITY = std::numeric_limits<double>::infinity();

/**
 * Shared contract of every range minimum strategy: built once from a sequence,
 * then point updates and inclusive range minimum queries.
 *
 * The public operations validate their arguments before touching any state,
 * then hand over to the strategy through do_update / do_query with indices
 * that are known to be in bounds and ordered.
 */
class RmqStructure {
public:
    virtual ~RmqStructure() = default;

    void update(int64_t index, double value);

    double query(int64_t left, int64_t right) const;

    // Dynamically typed variants: InvalidTypeError unless index/bounds hold an
    // integer and value holds a floating point number.
    void update(const Cell &index, const Cell &value);

    double query(const Cell &left, const Cell &right) const;

    size_t size() const { return values.size(); }

    const std::vector<double> &array() const { return values; }

protected:
    // Throws EmptyInputError for an empty sequence, InvalidTypeError if it holds NaN
    explicit RmqStructure(std::vector<double> vals);

    virtual void do_update(size_t index, double value) = 0;

    virtual double do_query(size_t left, size_t right) const = 0;

    std::vector<double> values;

private:
    size_t checked_index(int64_t index) const;
};

// Converts parsed cells into a numeric sequence. Integer cells are widened,
// string and NaN cells make the sequence improper (InvalidTypeError).
std::vector<double> numeric_sequence(const std::vector<Cell> &cells);
