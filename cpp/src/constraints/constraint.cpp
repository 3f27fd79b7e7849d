#include "space_sampling/constraints/constraint.hpp"
#include "space_sampling/core/errors.hpp"
#include <utility>

namespace space_sampling {

namespace {

const char* value_type_name(const Value& value) {
    if (is_int(value)) return "int";
    if (is_real(value)) return "float";
    return "str";
}

Value checked_single_value(Value value, DimensionType dimension_type) {
    switch (dimension_type) {
        case DimensionType::Categorical:
            break;
        case DimensionType::Integer:
            if (!is_int(value)) {
                throw ConstraintTypeError(
                    std::string("Single integer constraint must be of type int. Got ") + value_type_name(value)
                );
            }
            break;
        case DimensionType::Real:
            if (!is_real(value)) {
                throw ConstraintTypeError(
                    std::string("Single real constraint must be of type float. Got ") + value_type_name(value)
                );
            }
            break;
    }
    return value;
}

std::vector<Value> checked_bounds(std::vector<Value> bounds, DimensionType dimension_type) {
    if (bounds.size() <= 1) {
        throw ConstraintValueError("Bounds should be a tuple or list of length > 1.");
    }
    if (dimension_type != DimensionType::Categorical && bounds.size() != 2) {
        throw ConstraintValueError(
            "Length of bounds must be 2 for non-categorical constraints. Got " + std::to_string(bounds.size())
        );
    }
    for (const auto& bound : bounds) {
        if (dimension_type == DimensionType::Integer && !is_int(bound)) {
            throw ConstraintTypeError(
                std::string("Bounds must be of type int for integer dimension. Got ") + value_type_name(bound)
            );
        }
        if (dimension_type == DimensionType::Real && !is_real(bound)) {
            throw ConstraintTypeError(
                std::string("Bounds must be of type float for real dimension. Got ") + value_type_name(bound)
            );
        }
    }
    return bounds;
}

}  // namespace

Constraint::Constraint(int dimension, DimensionType dimension_type)
    : dimension_(dimension), dimension_type_(dimension_type) {
    if (dimension < 0) {
        throw ConstraintValueError("Dimension can not be a negative number. Got " + std::to_string(dimension));
    }
}

// Single

Single::Single(int dimension, Value value, DimensionType dimension_type)
    : Constraint(dimension, dimension_type)
    , value_(checked_single_value(std::move(value), dimension_type))
{
}

Single::Single(int dimension, Value value, const std::string& dimension_type)
    : Single(dimension, std::move(value), parse_dimension_type(dimension_type))
{
}

bool Single::validate(const Value& value) const {
    return values_equal(value, value_);
}

bool Single::equals(const Constraint& other) const {
    const auto* single = dynamic_cast<const Single*>(&other);
    return single != nullptr
        && single->dimension_ == dimension_
        && single->dimension_type_ == dimension_type_
        && values_equal(single->value_, value_);
}

std::string Single::to_string() const {
    return "Single(dimension=" + std::to_string(dimension_) +
           ", value=" + space_sampling::to_string(value_) +
           ", dimension_type=" + dimension_type_name(dimension_type_) + ")";
}

// Bound constraints

BoundConstraint::BoundConstraint(int dimension, std::vector<Value> bounds, DimensionType dimension_type)
    : Constraint(dimension, dimension_type)
    , bounds_(checked_bounds(std::move(bounds), dimension_type))
    , strategy_(dimension_type == DimensionType::Categorical ? Strategy::Categorical : Strategy::Numeric)
{
}

bool BoundConstraint::contains(const Value& value) const {
    switch (strategy_) {
        case Strategy::Categorical:
            return value_in(value, bounds_);
        case Strategy::Numeric:
            return value_in_range(value, bounds_[0], bounds_[1]);
    }
    return false;
}

bool BoundConstraint::equals(const Constraint& other) const {
    if (other.kind() != kind() || other.dimension() != dimension_ || other.dimension_type() != dimension_type_) {
        return false;
    }
    const auto* bound = dynamic_cast<const BoundConstraint*>(&other);
    if (bound == nullptr || bound->bounds_.size() != bounds_.size()) {
        return false;
    }
    for (size_t i = 0; i < bounds_.size(); ++i) {
        if (!values_equal(bound->bounds_[i], bounds_[i])) return false;
    }
    return true;
}

std::string BoundConstraint::describe(const char* name) const {
    return std::string(name) + "(dimension=" + std::to_string(dimension_) +
           ", bounds=" + space_sampling::to_string(bounds_) +
           ", dimension_type=" + dimension_type_name(dimension_type_) + ")";
}

Inclusive::Inclusive(int dimension, std::vector<Value> bounds, DimensionType dimension_type)
    : BoundConstraint(dimension, std::move(bounds), dimension_type)
{
}

Inclusive::Inclusive(int dimension, std::vector<Value> bounds, const std::string& dimension_type)
    : Inclusive(dimension, std::move(bounds), parse_dimension_type(dimension_type))
{
}

Exclusive::Exclusive(int dimension, std::vector<Value> bounds, DimensionType dimension_type)
    : BoundConstraint(dimension, std::move(bounds), dimension_type)
{
}

Exclusive::Exclusive(int dimension, std::vector<Value> bounds, const std::string& dimension_type)
    : Exclusive(dimension, std::move(bounds), parse_dimension_type(dimension_type))
{
}

}  // namespace space_sampling
