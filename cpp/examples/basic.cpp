#include <iostream>
#include "space_sampling/space_sampling.hpp"

using namespace space_sampling;

namespace {

void print_points(const std::vector<Point>& points) {
    for (const auto& point : points) {
        std::cout << "  " << to_string(point) << "\n";
    }
}

}  // namespace

int main() {
    std::cout << "Constrained Sampling Example\n";
    std::cout << "============================\n\n";

    // Create space
    std::vector<DimensionPtr> dimensions;
    dimensions.push_back(std::make_unique<Integer>(1, 10));
    dimensions.push_back(std::make_unique<Categorical>(std::vector<Value>{"a", "b", "c"}));
    dimensions.push_back(std::make_unique<Real>(0.0, 10.0));
    Space space(std::move(dimensions));
    std::cout << "Created " << space.to_string() << "\n\n";

    // Pin the integer, restrict the category, carve two holes in the real axis
    std::vector<ConstraintPtr> constraints;
    constraints.push_back(std::make_unique<Single>(0, Value{int64_t{5}}, DimensionType::Integer));
    constraints.push_back(std::make_unique<Inclusive>(1, std::vector<Value>{"a", "b"}, DimensionType::Categorical));
    constraints.push_back(std::make_unique<Exclusive>(2, std::vector<Value>{2.0, 4.0}, DimensionType::Real));
    constraints.push_back(std::make_unique<Exclusive>(2, std::vector<Value>{6.0, 8.0}, DimensionType::Real));

    ConstraintSet::Config config;
    config.verbose = true;
    ConstraintSet constraint_set(std::move(constraints), space, config);
    std::cout << constraint_set.to_string() << "\n\n";

    const size_t n_samples = 5;
    const uint64_t seed = 42;

    std::cout << "Unconstrained samples:\n";
    RNG rng(seed);
    print_points(space.rvs(n_samples, rng));

    std::cout << "\nConstrained samples:\n";
    auto points = constraint_set.rvs(n_samples, seed);
    print_points(points);

    // Ad hoc candidates
    std::cout << "\nValidity checks:\n";
    Point inside{int64_t{5}, std::string("a"), 1.0};
    Point outside{int64_t{5}, std::string("c"), 3.0};
    std::cout << "  " << to_string(inside) << " -> " << std::boolalpha
              << constraint_set.validate_sample(inside) << "\n";
    std::cout << "  " << to_string(outside) << " -> " << std::boolalpha
              << constraint_set.validate_sample(outside) << "\n";

    // Infeasible configuration
    std::vector<ConstraintPtr> infeasible;
    infeasible.push_back(std::make_unique<Inclusive>(2, std::vector<Value>{0.0, 1.0}, DimensionType::Real));
    infeasible.push_back(std::make_unique<Exclusive>(2, std::vector<Value>{0.0, 1.0}, DimensionType::Real));
    ConstraintSet empty_set(std::move(infeasible), space);
    try {
        (void)empty_set.rvs(n_samples, seed);
    } catch (const SamplingError& e) {
        std::cout << "\nInfeasible set rejected:\n  " << e.what() << "\n";
    }

    return 0;
}
