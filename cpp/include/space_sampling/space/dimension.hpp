#pragma once

#include "../core/value.hpp"
#include "../random/rng.hpp"
#include <memory>
#include <string>
#include <vector>

namespace space_sampling {

class Dimension;

// Unique pointer alias for dimensions
using DimensionPtr = std::unique_ptr<Dimension>;

/**
 * One axis of the search space.
 *
 * A dimension knows its type, its domain and how to draw uniform random
 * variates of its own native type. The constrained sampler only calls rvs()
 * and never looks at how the variates are produced.
 */
class Dimension {
public:
    virtual ~Dimension() = default;

    [[nodiscard]] virtual DimensionType type() const = 0;

    /**
     * Draw n_samples random values from this dimension.
     *
     * @param n_samples Number of values to draw
     * @param rng Generator shared by all draws of one sampling call
     * @return n_samples values of the dimension's native type
     */
    [[nodiscard]] virtual std::vector<Value> rvs(size_t n_samples, RNG& rng) const = 0;

    [[nodiscard]] virtual std::string to_string() const = 0;

    // Clone dimension (deep copy)
    [[nodiscard]] virtual DimensionPtr clone() const = 0;
};

// Real dimension, uniform on [low, high)
class Real : public Dimension {
public:
    Real(double low, double high);

    [[nodiscard]] DimensionType type() const override { return DimensionType::Real; }
    [[nodiscard]] std::vector<Value> rvs(size_t n_samples, RNG& rng) const override;
    [[nodiscard]] std::string to_string() const override;
    [[nodiscard]] DimensionPtr clone() const override {
        return std::make_unique<Real>(low_, high_);
    }

    [[nodiscard]] double low() const { return low_; }
    [[nodiscard]] double high() const { return high_; }

private:
    double low_;
    double high_;
};

// Integer dimension, uniform on [low, high] (both ends included)
class Integer : public Dimension {
public:
    Integer(int64_t low, int64_t high);

    [[nodiscard]] DimensionType type() const override { return DimensionType::Integer; }
    [[nodiscard]] std::vector<Value> rvs(size_t n_samples, RNG& rng) const override;
    [[nodiscard]] std::string to_string() const override;
    [[nodiscard]] DimensionPtr clone() const override {
        return std::make_unique<Integer>(low_, high_);
    }

    [[nodiscard]] int64_t low() const { return low_; }
    [[nodiscard]] int64_t high() const { return high_; }

private:
    int64_t low_;
    int64_t high_;
};

// Categorical dimension, uniform choice among an ordered list of categories
class Categorical : public Dimension {
public:
    explicit Categorical(std::vector<Value> categories);

    [[nodiscard]] DimensionType type() const override { return DimensionType::Categorical; }
    [[nodiscard]] std::vector<Value> rvs(size_t n_samples, RNG& rng) const override;
    [[nodiscard]] std::string to_string() const override;
    [[nodiscard]] DimensionPtr clone() const override {
        return std::make_unique<Categorical>(categories_);
    }

    [[nodiscard]] const std::vector<Value>& categories() const { return categories_; }
    [[nodiscard]] bool contains(const Value& value) const { return value_in(value, categories_); }

private:
    std::vector<Value> categories_;
};

}  // namespace space_sampling
