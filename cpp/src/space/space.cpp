#include "space_sampling/space/space.hpp"
#include "space_sampling/core/errors.hpp"

namespace space_sampling {

Space::Space(std::vector<DimensionPtr> dimensions) : dimensions_(std::move(dimensions)) {
    for (size_t i = 0; i < dimensions_.size(); ++i) {
        if (!dimensions_[i]) {
            throw ConstraintTypeError("Space dimension " + std::to_string(i) + " is null");
        }
    }
}

Space::Space(const Space& other) {
    dimensions_.reserve(other.dimensions_.size());
    for (const auto& dim : other.dimensions_) {
        dimensions_.push_back(dim->clone());
    }
}

Space& Space::operator=(const Space& other) {
    if (this != &other) {
        Space copy(other);
        dimensions_ = std::move(copy.dimensions_);
    }
    return *this;
}

std::vector<Point> Space::rvs(size_t n_samples, RNG& rng) const {
    std::vector<std::vector<Value>> columns;
    columns.reserve(dimensions_.size());
    for (const auto& dim : dimensions_) {
        columns.push_back(dim->rvs(n_samples, rng));
    }

    std::vector<Point> rows(n_samples);
    for (size_t i = 0; i < n_samples; ++i) {
        rows[i].reserve(columns.size());
        for (auto& column : columns) {
            rows[i].push_back(std::move(column[i]));
        }
    }
    return rows;
}

std::string Space::to_string() const {
    std::string out = "Space([";
    for (size_t i = 0; i < dimensions_.size(); ++i) {
        if (i > 0) out += ", ";
        out += dimensions_[i]->to_string();
    }
    out += "])";
    return out;
}

}  // namespace space_sampling
