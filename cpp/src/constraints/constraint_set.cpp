#include "space_sampling/constraints/constraint_set.hpp"
#include "space_sampling/constraints/check.hpp"
#include "space_sampling/core/errors.hpp"
#include <iostream>
#include <utility>

namespace space_sampling {

ConstraintSet::ConstraintSet(std::vector<ConstraintPtr> constraints, const Space& space)
    : ConstraintSet(std::move(constraints), space, Config{})
{
}

ConstraintSet::ConstraintSet(std::vector<ConstraintPtr> constraints, const Space& space, const Config& config)
    : space_(space)
    , constraints_list_(std::move(constraints))
    , config_(config)
{
    check_constraints(space_, constraints_list_);
    build_index();
}

ConstraintSet::ConstraintSet(const ConstraintSet& other)
    : space_(other.space_)
    , config_(other.config_)
{
    constraints_list_.reserve(other.constraints_list_.size());
    for (const auto& constraint : other.constraints_list_) {
        constraints_list_.push_back(constraint->clone());
    }
    build_index();
}

ConstraintSet& ConstraintSet::operator=(const ConstraintSet& other) {
    if (this != &other) {
        ConstraintSet copy(other);
        *this = std::move(copy);
    }
    return *this;
}

void ConstraintSet::build_index() {
    const size_t n_dims = space_.n_dims();
    single_.assign(n_dims, nullptr);
    inclusive_.assign(n_dims, {});
    exclusive_.assign(n_dims, {});

    // check_constraints() guarantees every entry is one of the three kinds
    for (const auto& constraint : constraints_list_) {
        const auto dim = static_cast<size_t>(constraint->dimension());
        if (const auto* single = dynamic_cast<const Single*>(constraint.get())) {
            single_[dim] = single;
        } else if (const auto* inclusive = dynamic_cast<const Inclusive*>(constraint.get())) {
            inclusive_[dim].push_back(inclusive);
        } else if (const auto* exclusive = dynamic_cast<const Exclusive*>(constraint.get())) {
            exclusive_[dim].push_back(exclusive);
        }
    }
}

std::vector<Point> ConstraintSet::rvs(size_t n_samples, std::optional<uint64_t> seed) const {
    RNG rng = make_rng(seed);
    return rvs(n_samples, rng);
}

std::vector<Point> ConstraintSet::rvs(size_t n_samples, RNG& rng) const {
    const size_t n_dims = space_.n_dims();
    std::vector<Point> rows;
    rows.reserve(n_samples);
    size_t n_samples_candidates = 0;
    size_t round = 0;

    while (rows.size() < n_samples) {
        std::vector<std::vector<Value>> columns;
        columns.reserve(n_dims);
        for (size_t i = 0; i < n_dims; ++i) {
            if (single_[i] != nullptr) {
                columns.emplace_back(n_samples, single_[i]->value());
            } else {
                columns.push_back(space_.dimension(i).rvs(n_samples, rng));
            }
        }

        // Transpose and keep the valid candidates in generation order
        for (size_t i = 0; i < n_samples; ++i) {
            Point candidate;
            candidate.reserve(n_dims);
            for (size_t j = 0; j < n_dims; ++j) {
                candidate.push_back(std::move(columns[j][i]));
            }
            if (validate_sample(candidate)) {
                rows.push_back(std::move(candidate));
            }
        }

        n_samples_candidates += n_samples;
        ++round;
        if (config_.verbose) {
            std::cout << "[ConstraintSet] round=" << round
                      << " candidates=" << n_samples_candidates
                      << " accepted=" << rows.size() << "/" << n_samples << "\n";
        }

        if (n_samples_candidates > config_.max_candidates && rows.empty()) {
            throw SamplingError("Could not find valid samples with constraints " + to_string());
        }
    }

    rows.resize(n_samples);
    return rows;
}

bool ConstraintSet::validate_sample(const Point& sample) const {
    if (sample.size() > space_.n_dims()) {
        throw ConstraintIndexError(
            "Sample has " + std::to_string(sample.size()) + " values for a space with n_dims = " +
            std::to_string(space_.n_dims())
        );
    }

    for (size_t dim = 0; dim < sample.size(); ++dim) {
        const Value& value = sample[dim];

        if (single_[dim] != nullptr && !single_[dim]->validate(value)) {
            return false;
        }

        // Inclusive constraints: at least one must accept
        if (!inclusive_[dim].empty()) {
            bool value_is_valid = false;
            for (const Inclusive* constraint : inclusive_[dim]) {
                if (constraint->validate(value)) {
                    value_is_valid = true;
                    break;
                }
            }
            if (!value_is_valid) {
                return false;
            }
        }

        // Exclusive constraints: all must accept
        for (const Exclusive* constraint : exclusive_[dim]) {
            if (!constraint->validate(value)) {
                return false;
            }
        }
    }
    return true;
}

bool ConstraintSet::operator==(const ConstraintSet& other) const {
    if (constraints_list_.size() != other.constraints_list_.size()) {
        return false;
    }
    for (size_t i = 0; i < constraints_list_.size(); ++i) {
        if (!constraints_list_[i]->equals(*other.constraints_list_[i])) {
            return false;
        }
    }
    return true;
}

std::string ConstraintSet::to_string() const {
    std::string out = "ConstraintSet([";
    for (size_t i = 0; i < constraints_list_.size(); ++i) {
        if (i > 0) out += ", ";
        out += constraints_list_[i]->to_string();
    }
    out += "])";
    return out;
}

}  // namespace space_sampling
