#pragma once

#include "constraint.hpp"
#include "../space/space.hpp"
#include <vector>

namespace space_sampling {

/**
 * Check a list of constraints against the dimensions of a space.
 *
 * Runs every construction-time check in list order and throws on the first
 * violation:
 *   - ConstraintTypeError: null or unknown constraint, declared dimension
 *     type differs from the space dimension, unknown dimension class
 *   - ConstraintIndexError: dimension index >= n_dims, or a second Single
 *     constraint on an already pinned dimension
 *   - ConstraintValueError: Single value or bound outside the dimension's
 *     domain
 */
void check_constraints(const Space& space, const std::vector<ConstraintPtr>& constraints);

// Throws ConstraintValueError if value is outside dim's range or categories
void check_value(const Dimension& dim, const Value& value);

// Throws ConstraintValueError if any bound is outside dim's range or categories
void check_bounds(const Dimension& dim, const std::vector<Value>& bounds);

}  // namespace space_sampling
