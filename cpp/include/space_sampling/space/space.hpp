#pragma once

#include "dimension.hpp"
#include <string>
#include <vector>

namespace space_sampling {

// Ordered list of dimensions. Dimension order is the order of point coordinates.
class Space {
public:
    Space() = default;
    explicit Space(std::vector<DimensionPtr> dimensions);

    Space(const Space& other);
    Space& operator=(const Space& other);
    Space(Space&&) noexcept = default;
    Space& operator=(Space&&) noexcept = default;

    [[nodiscard]] size_t n_dims() const { return dimensions_.size(); }
    [[nodiscard]] const std::vector<DimensionPtr>& dimensions() const { return dimensions_; }
    [[nodiscard]] const Dimension& dimension(size_t i) const { return *dimensions_.at(i); }

    // Draw n_samples unconstrained points (one column per dimension, then transposed)
    [[nodiscard]] std::vector<Point> rvs(size_t n_samples, RNG& rng) const;

    [[nodiscard]] std::string to_string() const;

private:
    std::vector<DimensionPtr> dimensions_;
};

}  // namespace space_sampling
