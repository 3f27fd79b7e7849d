#include "space_sampling/core/value.hpp"
#include "space_sampling/core/errors.hpp"
#include <cmath>
#include <sstream>
#include <iomanip>
#include <limits>

namespace space_sampling {

DimensionType parse_dimension_type(const std::string& name) {
    if (name == "real") return DimensionType::Real;
    if (name == "integer") return DimensionType::Integer;
    if (name == "categorical") return DimensionType::Categorical;
    throw ConstraintValueError(
        "`dimension_type` must be a string containing \"categorical\", \"integer\" or \"real\". Got " + name
    );
}

const char* dimension_type_name(DimensionType type) {
    switch (type) {
        case DimensionType::Real:
            return "real";
        case DimensionType::Integer:
            return "integer";
        case DimensionType::Categorical:
            return "categorical";
    }
    return "unknown";
}

double as_double(const Value& v) {
    if (const auto* i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&v)) return *d;
    return 0.0;
}

bool values_equal(const Value& a, const Value& b) {
    if (is_string(a) || is_string(b)) {
        return is_string(a) && is_string(b) && std::get<std::string>(a) == std::get<std::string>(b);
    }
    if (is_int(a) && is_int(b)) {
        return std::get<int64_t>(a) == std::get<int64_t>(b);
    }
    return as_double(a) == as_double(b);
}

bool value_less(const Value& a, const Value& b) {
    if (is_string(a) || is_string(b)) {
        return false;
    }
    if (is_int(a) && is_int(b)) {
        return std::get<int64_t>(a) < std::get<int64_t>(b);
    }
    return as_double(a) < as_double(b);
}

bool value_in_range(const Value& v, const Value& lo, const Value& hi) {
    if (is_string(v) || is_string(lo) || is_string(hi)) {
        return false;
    }
    // NaN compares false against both ends
    if (is_real(v) && std::isnan(std::get<double>(v))) {
        return false;
    }
    return !value_less(v, lo) && !value_less(hi, v);
}

bool value_in(const Value& v, const std::vector<Value>& values) {
    for (const auto& candidate : values) {
        if (values_equal(v, candidate)) return true;
    }
    return false;
}

std::string to_string(const Value& v) {
    if (const auto* i = std::get_if<int64_t>(&v)) {
        return std::to_string(*i);
    }
    if (const auto* s = std::get_if<std::string>(&v)) {
        return "'" + *s + "'";
    }
    double d = std::get<double>(v);
    std::ostringstream os;
    os << std::setprecision(std::numeric_limits<double>::max_digits10 - 2) << d;
    std::string out = os.str();
    // Keep reals recognisable: 5 -> 5.0
    if (std::isfinite(d) && out.find_first_of(".e") == std::string::npos) {
        out += ".0";
    }
    return out;
}

std::string to_string(const std::vector<Value>& values) {
    std::string out = "(";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += to_string(values[i]);
    }
    out += ")";
    return out;
}

}  // namespace space_sampling
