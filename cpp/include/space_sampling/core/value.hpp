#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace space_sampling {

// A single coordinate of a point: integer, real or string (categorical)
using Value = std::variant<int64_t, double, std::string>;

// A point in the search space, one value per dimension in dimension order
using Point = std::vector<Value>;

// Declared type of a search-space dimension
enum class DimensionType {
    Real,
    Integer,
    Categorical
};

// Parse "real", "integer" or "categorical"; throws ConstraintValueError otherwise
[[nodiscard]] DimensionType parse_dimension_type(const std::string& name);
[[nodiscard]] const char* dimension_type_name(DimensionType type);

[[nodiscard]] inline bool is_int(const Value& v) { return std::holds_alternative<int64_t>(v); }
[[nodiscard]] inline bool is_real(const Value& v) { return std::holds_alternative<double>(v); }
[[nodiscard]] inline bool is_string(const Value& v) { return std::holds_alternative<std::string>(v); }
[[nodiscard]] inline bool is_numeric(const Value& v) { return !is_string(v); }

// Numeric value as double (0.0 for strings)
[[nodiscard]] double as_double(const Value& v);

// Equality across alternatives: 5 == 5.0, strings only equal strings
[[nodiscard]] bool values_equal(const Value& a, const Value& b);

// Numeric ordering a < b. False whenever either side is a string.
[[nodiscard]] bool value_less(const Value& a, const Value& b);

// lo <= v <= hi for numeric values; false if any of them is a string
[[nodiscard]] bool value_in_range(const Value& v, const Value& lo, const Value& hi);

// True if v equals one of values
[[nodiscard]] bool value_in(const Value& v, const std::vector<Value>& values);

// Printable form: 5, 5.0, 'a'
[[nodiscard]] std::string to_string(const Value& v);
[[nodiscard]] std::string to_string(const std::vector<Value>& values);

}  // namespace space_sampling
