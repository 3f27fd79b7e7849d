#pragma once

#include "../core/value.hpp"
#include <memory>
#include <string>
#include <vector>

namespace space_sampling {

class Constraint;

// Unique pointer alias for constraints
using ConstraintPtr = std::unique_ptr<Constraint>;

enum class ConstraintKind {
    Single,     // Pin a dimension to one value
    Inclusive,  // Value must lie inside the bounds (OR-combined per dimension)
    Exclusive   // Value must lie outside the bounds (AND-combined per dimension)
};

/**
 * Base class for constraints on a single dimension.
 *
 * A constraint is bound to a dimension index and carries the declared type of
 * that dimension. Whether the declaration agrees with the actual space is
 * checked later, by check_constraints(), when a ConstraintSet is built.
 */
class Constraint {
public:
    virtual ~Constraint() = default;

    [[nodiscard]] virtual ConstraintKind kind() const = 0;

    // True if value satisfies this constraint on its own
    [[nodiscard]] virtual bool validate(const Value& value) const = 0;

    [[nodiscard]] virtual bool equals(const Constraint& other) const = 0;

    [[nodiscard]] virtual std::string to_string() const = 0;

    // Clone constraint (deep copy)
    [[nodiscard]] virtual ConstraintPtr clone() const = 0;

    [[nodiscard]] int dimension() const { return dimension_; }
    [[nodiscard]] DimensionType dimension_type() const { return dimension_type_; }

protected:
    // Throws ConstraintValueError for a negative dimension index
    Constraint(int dimension, DimensionType dimension_type);

    int dimension_;
    DimensionType dimension_type_;
};

[[nodiscard]] inline bool operator==(const Constraint& a, const Constraint& b) {
    return a.equals(b);
}

[[nodiscard]] inline bool operator!=(const Constraint& a, const Constraint& b) {
    return !a.equals(b);
}

// Every value drawn for the dimension must equal `value`
class Single : public Constraint {
public:
    /**
     * @param dimension Index of the constrained dimension
     * @param value Enforced value: int for integer dimensions, float for real
     *        dimensions, int, float or string for categorical dimensions
     * @param dimension_type Declared type of the dimension
     * @throws ConstraintTypeError if the value type does not fit dimension_type
     * @throws ConstraintValueError if dimension is negative
     */
    Single(int dimension, Value value, DimensionType dimension_type);
    Single(int dimension, Value value, const std::string& dimension_type);

    [[nodiscard]] ConstraintKind kind() const override { return ConstraintKind::Single; }
    [[nodiscard]] bool validate(const Value& value) const override;
    [[nodiscard]] bool equals(const Constraint& other) const override;
    [[nodiscard]] std::string to_string() const override;
    [[nodiscard]] ConstraintPtr clone() const override {
        return std::make_unique<Single>(*this);
    }

    [[nodiscard]] const Value& value() const { return value_; }

private:
    Value value_;
};

/**
 * Shared base of Inclusive and Exclusive.
 *
 * For real and integer dimensions the bounds are a closed range (low, high).
 * For categorical dimensions the bounds are a set of at least two categories.
 */
class BoundConstraint : public Constraint {
public:
    [[nodiscard]] const std::vector<Value>& bounds() const { return bounds_; }

    [[nodiscard]] bool equals(const Constraint& other) const override;

protected:
    // Throws ConstraintValueError on a malformed bounds list and
    // ConstraintTypeError on bound elements of the wrong type
    BoundConstraint(int dimension, std::vector<Value> bounds, DimensionType dimension_type);

    // True if value is among (categorical) or within (numeric) the bounds
    [[nodiscard]] bool contains(const Value& value) const;

    [[nodiscard]] std::string describe(const char* name) const;

private:
    enum class Strategy {
        Categorical,
        Numeric
    };

    std::vector<Value> bounds_;
    Strategy strategy_;
};

// Values must be inside the bounds, bound values included
class Inclusive : public BoundConstraint {
public:
    Inclusive(int dimension, std::vector<Value> bounds, DimensionType dimension_type);
    Inclusive(int dimension, std::vector<Value> bounds, const std::string& dimension_type);

    [[nodiscard]] ConstraintKind kind() const override { return ConstraintKind::Inclusive; }
    [[nodiscard]] bool validate(const Value& value) const override { return contains(value); }
    [[nodiscard]] std::string to_string() const override { return describe("Inclusive"); }
    [[nodiscard]] ConstraintPtr clone() const override {
        return std::make_unique<Inclusive>(*this);
    }
};

// Values must be outside the bounds, bound values excluded
class Exclusive : public BoundConstraint {
public:
    Exclusive(int dimension, std::vector<Value> bounds, DimensionType dimension_type);
    Exclusive(int dimension, std::vector<Value> bounds, const std::string& dimension_type);

    [[nodiscard]] ConstraintKind kind() const override { return ConstraintKind::Exclusive; }
    [[nodiscard]] bool validate(const Value& value) const override { return !contains(value); }
    [[nodiscard]] std::string to_string() const override { return describe("Exclusive"); }
    [[nodiscard]] ConstraintPtr clone() const override {
        return std::make_unique<Exclusive>(*this);
    }
};

}  // namespace space_sampling
