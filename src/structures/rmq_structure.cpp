#include "structures/rmq_structure.h"

#include <cmath>
#include <utility>

RmqStructure::RmqStructure(std::vector<double> vals) : values(std::move(vals)) {
    if (values.empty()) throw EmptyInputError();

    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i])) {
            throw InvalidTypeError("Input array must hold real numbers, element " + std::to_string(i) + " is NaN.");
        }
    }
}

size_t RmqStructure::checked_index(int64_t index) const {
    if (index < 0 || static_cast<uint64_t>(index) >= values.size()) {
        throw IndexOutOfBoundsError("Index " + std::to_string(index) + " is out of bounds.");
    }
    return static_cast<size_t>(index);
}

void RmqStructure::update(int64_t index, double value) {
    if (std::isnan(value)) throw InvalidTypeError("New value must be a real number, got NaN.");
    size_t i = checked_index(index);
    do_update(i, value);
}

double RmqStructure::query(int64_t left, int64_t right) const {
    if (left < 0 || right < 0 ||
        static_cast<uint64_t>(left) >= values.size() ||
        static_cast<uint64_t>(right) >= values.size()) {
        throw IndexOutOfBoundsError("Range indices are out of bounds.");
    }
    if (left > right) throw InvalidRangeError();

    return do_query(static_cast<size_t>(left), static_cast<size_t>(right));
}

void RmqStructure::update(const Cell &index, const Cell &value) {
    if (!std::holds_alternative<int64_t>(index)) {
        throw InvalidTypeError("Index must be an integer.");
    }
    if (!std::holds_alternative<double>(value)) {
        throw InvalidTypeError("New value must be a float.");
    }
    update(std::get<int64_t>(index), std::get<double>(value));
}

double RmqStructure::query(const Cell &left, const Cell &right) const {
    if (!std::holds_alternative<int64_t>(left) || !std::holds_alternative<int64_t>(right)) {
        throw InvalidTypeError("Both left and right indices must be integers.");
    }
    return query(std::get<int64_t>(left), std::get<int64_t>(right));
}

std::vector<double> numeric_sequence(const std::vector<Cell> &cells) {
    std::vector<double> result;
    result.reserve(cells.size());

    for (size_t i = 0; i < cells.size(); ++i) {
        const Cell &cell = cells[i];
        if (const auto *d = std::get_if<double>(&cell)) {
            if (std::isnan(*d)) {
                throw InvalidTypeError("Input array must hold real numbers, element " + std::to_string(i) + " is NaN.");
            }
            result.push_back(*d);
        } else if (const auto *n = std::get_if<int64_t>(&cell)) {
            result.push_back(static_cast<double>(*n));
        } else {
            throw InvalidTypeError("Input array must be numeric, element " + std::to_string(i) +
                                   " is \"" + std::get<std::string>(cell) + "\".");
        }
    }
    return result;
}
