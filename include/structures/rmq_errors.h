#pragma once
#include <stdexcept>
#include <string>

// Base for every validation failure raised by a range minimum structure.
// A failed call leaves the structure unchanged and usable.
class RmqError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Argument of the wrong kind (non-integral index, non-floating value, non-numeric sequence)
class InvalidTypeError : public RmqError {
public:
    using RmqError::RmqError;
};

class EmptyInputError : public RmqError {
public:
    EmptyInputError() : RmqError("Input array cannot be empty.") {}
};

class IndexOutOfBoundsError : public RmqError {
public:
    using RmqError::RmqError;
};

// left > right
class InvalidRangeError : public RmqError {
public:
    InvalidRangeError() : RmqError("Left index cannot be greater than right index.") {}
};
