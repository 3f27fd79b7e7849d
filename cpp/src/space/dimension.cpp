#include "space_sampling/space/dimension.hpp"
#include "space_sampling/core/errors.hpp"
#include <cmath>
#include <utility>

namespace space_sampling {

Real::Real(double low, double high) : low_(low), high_(high) {
    if (!std::isfinite(low) || !std::isfinite(high)) {
        throw ConstraintValueError("Real dimension bounds must be finite");
    }
    if (!(low < high)) {
        throw ConstraintValueError(
            "Real dimension requires low < high. Got " + to_string()
        );
    }
    if (!std::isfinite(high - low)) {
        throw ConstraintValueError(
            "Real dimension width high - low overflows. Got " + to_string()
        );
    }
}

std::vector<Value> Real::rvs(size_t n_samples, RNG& rng) const {
    std::vector<Value> column;
    column.reserve(n_samples);
    for (size_t i = 0; i < n_samples; ++i) {
        column.emplace_back(rng.uniform(low_, high_));
    }
    return column;
}

std::string Real::to_string() const {
    return "Real(low=" + space_sampling::to_string(Value{low_}) +
           ", high=" + space_sampling::to_string(Value{high_}) + ")";
}

Integer::Integer(int64_t low, int64_t high) : low_(low), high_(high) {
    if (low > high) {
        throw ConstraintValueError(
            "Integer dimension requires low <= high. Got " + to_string()
        );
    }
}

std::vector<Value> Integer::rvs(size_t n_samples, RNG& rng) const {
    std::vector<Value> column;
    column.reserve(n_samples);
    for (size_t i = 0; i < n_samples; ++i) {
        column.emplace_back(rng.randint(low_, high_));
    }
    return column;
}

std::string Integer::to_string() const {
    return "Integer(low=" + std::to_string(low_) + ", high=" + std::to_string(high_) + ")";
}

Categorical::Categorical(std::vector<Value> categories) : categories_(std::move(categories)) {
    if (categories_.empty()) {
        throw ConstraintValueError("Categorical dimension needs at least one category");
    }
    for (size_t i = 0; i < categories_.size(); ++i) {
        for (size_t j = i + 1; j < categories_.size(); ++j) {
            if (values_equal(categories_[i], categories_[j])) {
                throw ConstraintValueError(
                    "Categorical dimension has duplicate category " + space_sampling::to_string(categories_[i])
                );
            }
        }
    }
}

std::vector<Value> Categorical::rvs(size_t n_samples, RNG& rng) const {
    std::vector<Value> column;
    column.reserve(n_samples);
    for (size_t i = 0; i < n_samples; ++i) {
        column.push_back(categories_[rng.index(categories_.size())]);
    }
    return column;
}

std::string Categorical::to_string() const {
    return "Categorical(categories=" + space_sampling::to_string(categories_) + ")";
}

}  // namespace space_sampling
