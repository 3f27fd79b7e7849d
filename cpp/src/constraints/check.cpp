#include "space_sampling/constraints/check.hpp"
#include "space_sampling/core/errors.hpp"

namespace space_sampling {

namespace {

// Domain membership for one value. Numeric dimensions compare against
// [low, high]; categorical dimensions look the value up among the categories.
bool in_domain(const Dimension& dim, const Value& value) {
    if (const auto* real = dynamic_cast<const Real*>(&dim)) {
        return value_in_range(value, Value{real->low()}, Value{real->high()});
    }
    if (const auto* integer = dynamic_cast<const Integer*>(&dim)) {
        return value_in_range(value, Value{integer->low()}, Value{integer->high()});
    }
    if (const auto* categorical = dynamic_cast<const Categorical*>(&dim)) {
        return categorical->contains(value);
    }
    throw ConstraintTypeError("Can not find valid dimension for " + dim.to_string());
}

std::string domain_string(const Dimension& dim) {
    if (const auto* real = dynamic_cast<const Real*>(&dim)) {
        return "[" + to_string(Value{real->low()}) + ", " + to_string(Value{real->high()}) + "]";
    }
    if (const auto* integer = dynamic_cast<const Integer*>(&dim)) {
        return "[" + std::to_string(integer->low()) + ", " + std::to_string(integer->high()) + "]";
    }
    if (const auto* categorical = dynamic_cast<const Categorical*>(&dim)) {
        return to_string(categorical->categories());
    }
    return dim.to_string();
}

// Actual type of a space dimension, from its class rather than its tag
DimensionType actual_type(const Dimension& dim) {
    if (dynamic_cast<const Real*>(&dim)) return DimensionType::Real;
    if (dynamic_cast<const Integer*>(&dim)) return DimensionType::Integer;
    if (dynamic_cast<const Categorical*>(&dim)) return DimensionType::Categorical;
    throw ConstraintTypeError("Can not find valid dimension for " + dim.to_string());
}

}  // namespace

void check_value(const Dimension& dim, const Value& value) {
    if (in_domain(dim, value)) {
        return;
    }
    if (dim.type() == DimensionType::Categorical) {
        throw ConstraintValueError(
            "Categorical value " + to_string(value) + " is not in space with categories " + domain_string(dim)
        );
    }
    throw ConstraintValueError("Value " + to_string(value) + " exceeds bounds of space " + domain_string(dim));
}

void check_bounds(const Dimension& dim, const std::vector<Value>& bounds) {
    for (const auto& value : bounds) {
        if (in_domain(dim, value)) {
            continue;
        }
        if (dim.type() == DimensionType::Categorical) {
            throw ConstraintValueError(
                "Categorical value " + to_string(value) + " is not in space with categories " + domain_string(dim)
            );
        }
        throw ConstraintValueError(
            "Bounds " + to_string(bounds) + " exceeds bounds of space " + domain_string(dim)
        );
    }
}

void check_constraints(const Space& space, const std::vector<ConstraintPtr>& constraints) {
    const size_t n_dims = space.n_dims();
    std::vector<bool> single_constraints(n_dims, false);

    for (size_t i = 0; i < constraints.size(); ++i) {
        const Constraint* constraint = constraints[i].get();
        if (constraint == nullptr) {
            throw ConstraintTypeError("Constraint " + std::to_string(i) + " is null");
        }

        // Constructors reject negative indices
        const auto ind_dim = static_cast<size_t>(constraint->dimension());
        if (ind_dim >= n_dims) {
            throw ConstraintIndexError(
                "Dimension index " + std::to_string(ind_dim) + " out of range for n_dims = " + std::to_string(n_dims)
            );
        }
        const Dimension& space_dim = space.dimension(ind_dim);

        const DimensionType expected = actual_type(space_dim);
        if (constraint->dimension_type() != expected) {
            throw ConstraintTypeError(
                std::string("Constraint for ") + dimension_type_name(expected) + " dimension " +
                std::to_string(ind_dim) + " must be of dimension_type " + dimension_type_name(expected) +
                ". Got " + dimension_type_name(constraint->dimension_type())
            );
        }

        if (const auto* single = dynamic_cast<const Single*>(constraint)) {
            if (single_constraints[ind_dim]) {
                throw ConstraintIndexError(
                    "Can not add more than one Single-type constraint to dimension " + std::to_string(ind_dim)
                );
            }
            single_constraints[ind_dim] = true;
            check_value(space_dim, single->value());
        } else if (dynamic_cast<const Inclusive*>(constraint) || dynamic_cast<const Exclusive*>(constraint)) {
            check_bounds(space_dim, static_cast<const BoundConstraint*>(constraint)->bounds());
        } else {
            throw ConstraintTypeError(
                "Constraints must be of type \"Single\", \"Exclusive\" or \"Inclusive\". Got " + constraint->to_string()
            );
        }
    }
}

}  // namespace space_sampling
