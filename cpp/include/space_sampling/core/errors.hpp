#pragma once

#include <stdexcept>
#include <string>

namespace space_sampling {

// A declared dimension type, value type or bound type does not match, or a
// constraint is of no recognised kind.
class ConstraintTypeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// A value or bound lies outside its dimension's domain, or a constructor
// argument is malformed.
class ConstraintValueError : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

// A dimension index is out of range, or a dimension is pinned twice.
class ConstraintIndexError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// Rejection sampling gave up without a single valid candidate.
class SamplingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace space_sampling
