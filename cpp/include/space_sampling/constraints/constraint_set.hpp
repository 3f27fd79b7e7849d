#pragma once

#include "constraint.hpp"
#include "../space/space.hpp"
#include "../random/rng.hpp"
#include <optional>
#include <string>
#include <vector>

namespace space_sampling {

/**
 * Validated, indexed list of constraints over a space.
 *
 * Construction runs check_constraints() and then sorts the constraints into
 * three per-dimension indexes: at most one Single, a list of Inclusive and a
 * list of Exclusive constraints. The set is immutable afterwards and can be
 * used for any number of sampling calls.
 *
 * A point is valid when, for every dimension d:
 *   single[d] (if any) accepts the value,
 *   at least one of inclusive[d] accepts it (if inclusive[d] is non-empty),
 *   every one of exclusive[d] accepts it.
 */
class ConstraintSet {
public:
    struct Config {
        size_t max_candidates{10000};  // Give up once this many candidates gave zero valid points
        bool verbose{false};           // Log every sampling round to stdout
    };

    ConstraintSet(std::vector<ConstraintPtr> constraints, const Space& space);
    ConstraintSet(std::vector<ConstraintPtr> constraints, const Space& space, const Config& config);

    ConstraintSet(const ConstraintSet& other);
    ConstraintSet& operator=(const ConstraintSet& other);
    ConstraintSet(ConstraintSet&&) noexcept = default;
    ConstraintSet& operator=(ConstraintSet&&) noexcept = default;

    /**
     * Draw n_samples points that all satisfy the constraints.
     *
     * Candidates are generated n_samples at a time, one column per dimension
     * in dimension order. Pinned dimensions use the Single value and consume
     * no random numbers. Generation stops once n_samples valid points have
     * been collected; surplus valid points of the last batch are dropped.
     *
     * @param n_samples Number of points to return
     * @param rng Generator threaded through every draw
     * @return n_samples points, each of length n_dims
     * @throws SamplingError if more than config().max_candidates candidates
     *         were generated without a single valid one
     */
    [[nodiscard]] std::vector<Point> rvs(size_t n_samples, RNG& rng) const;

    // Same as above with a generator built from seed (or from
    // std::random_device when no seed is given)
    [[nodiscard]] std::vector<Point> rvs(size_t n_samples = 1, std::optional<uint64_t> seed = std::nullopt) const;

    // True if the point satisfies every constraint. Never throws for a point
    // of at most n_dims coordinates.
    [[nodiscard]] bool validate_sample(const Point& sample) const;

    [[nodiscard]] const std::vector<ConstraintPtr>& constraints() const { return constraints_list_; }
    [[nodiscard]] const Space& space() const { return space_; }

    // Per-dimension indexes
    [[nodiscard]] const Single* single(size_t dim) const { return single_.at(dim); }
    [[nodiscard]] const std::vector<const Inclusive*>& inclusive(size_t dim) const { return inclusive_.at(dim); }
    [[nodiscard]] const std::vector<const Exclusive*>& exclusive(size_t dim) const { return exclusive_.at(dim); }

    [[nodiscard]] const Config& config() const { return config_; }
    void set_config(const Config& config) { config_ = config; }

    // Equal when the ordered constraint lists are equal
    [[nodiscard]] bool operator==(const ConstraintSet& other) const;
    [[nodiscard]] bool operator!=(const ConstraintSet& other) const { return !(*this == other); }

    [[nodiscard]] std::string to_string() const;

private:
    Space space_;
    std::vector<ConstraintPtr> constraints_list_;
    Config config_;

    // Non-owning views into constraints_list_
    std::vector<const Single*> single_;
    std::vector<std::vector<const Inclusive*>> inclusive_;
    std::vector<std::vector<const Exclusive*>> exclusive_;

    void build_index();
};

}  // namespace space_sampling
