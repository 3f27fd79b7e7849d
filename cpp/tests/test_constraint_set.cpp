#include <catch2/catch_test_macros.hpp>
#include "space_sampling/constraints/constraint_set.hpp"
#include "space_sampling/core/errors.hpp"
#include <type_traits>
#include <utility>

using namespace space_sampling;

namespace {

Space make_space(std::vector<DimensionPtr> dims) {
    return Space(std::move(dims));
}

template <typename... Ts>
std::vector<ConstraintPtr> make_list(Ts&&... constraints) {
    std::vector<ConstraintPtr> list;
    (list.push_back(std::make_unique<std::decay_t<Ts>>(std::forward<Ts>(constraints))), ...);
    return list;
}

Space real_space() {
    std::vector<DimensionPtr> dims;
    dims.push_back(std::make_unique<Real>(0.0, 10.0));
    return make_space(std::move(dims));
}

Space integer_space() {
    std::vector<DimensionPtr> dims;
    dims.push_back(std::make_unique<Integer>(0, 10));
    return make_space(std::move(dims));
}

}  // namespace

TEST_CASE("ConstraintSet construction", "[constraint_set]") {
    SECTION("Indexes by dimension and kind") {
        std::vector<DimensionPtr> dims;
        dims.push_back(std::make_unique<Real>(0.0, 10.0));
        dims.push_back(std::make_unique<Integer>(0, 10));
        dims.push_back(std::make_unique<Categorical>(std::vector<Value>{"a", "b", "c"}));
        Space space = make_space(std::move(dims));

        ConstraintSet set(make_list(
            Inclusive(0, std::vector<Value>{0.0, 1.0}, DimensionType::Real),
            Single(1, Value{int64_t{4}}, DimensionType::Integer),
            Inclusive(0, std::vector<Value>{5.0, 6.0}, DimensionType::Real),
            Exclusive(2, std::vector<Value>{"a", "b"}, DimensionType::Categorical)
        ), space);

        REQUIRE(set.constraints().size() == 4);
        REQUIRE(set.single(0) == nullptr);
        REQUIRE(set.single(1) != nullptr);
        REQUIRE(set.single(2) == nullptr);
        REQUIRE(set.inclusive(0).size() == 2);
        REQUIRE(set.inclusive(1).empty());
        REQUIRE(set.exclusive(2).size() == 1);
        REQUIRE(set.exclusive(0).empty());
    }

    SECTION("Invalid list never yields a set") {
        REQUIRE_THROWS_AS(
            ConstraintSet(make_list(
                Single(0, Value{1.0}, DimensionType::Real),
                Single(0, Value{2.0}, DimensionType::Real)
            ), real_space()),
            ConstraintIndexError
        );
        REQUIRE_THROWS_AS(
            ConstraintSet(make_list(Single(0, Value{11.0}, DimensionType::Real)), real_space()),
            ConstraintValueError
        );
        REQUIRE_THROWS_AS(
            ConstraintSet(make_list(Single(0, Value{int64_t{1}}, DimensionType::Integer)), real_space()),
            ConstraintTypeError
        );
    }

    SECTION("Default configuration") {
        ConstraintSet set({}, real_space());
        REQUIRE(set.config().max_candidates == 10000);
        REQUIRE_FALSE(set.config().verbose);
    }
}

TEST_CASE("validate_sample", "[constraint_set]") {
    SECTION("Inclusive constraints combine with OR") {
        ConstraintSet set(make_list(
            Inclusive(0, std::vector<Value>{0.0, 1.0}, DimensionType::Real),
            Inclusive(0, std::vector<Value>{5.0, 6.0}, DimensionType::Real)
        ), real_space());

        REQUIRE_FALSE(set.validate_sample({Value{3.0}}));
        REQUIRE(set.validate_sample({Value{0.5}}));
        REQUIRE(set.validate_sample({Value{5.5}}));
    }

    SECTION("Exclusive constraints combine with AND") {
        ConstraintSet set(make_list(
            Exclusive(0, std::vector<Value>{int64_t{0}, int64_t{2}}, DimensionType::Integer),
            Exclusive(0, std::vector<Value>{int64_t{8}, int64_t{10}}, DimensionType::Integer)
        ), integer_space());

        REQUIRE_FALSE(set.validate_sample({Value{int64_t{1}}}));
        REQUIRE_FALSE(set.validate_sample({Value{int64_t{9}}}));
        REQUIRE(set.validate_sample({Value{int64_t{5}}}));
    }

    SECTION("Single, Inclusive and Exclusive on one dimension") {
        ConstraintSet set(make_list(
            Single(0, Value{int64_t{4}}, DimensionType::Integer),
            Inclusive(0, std::vector<Value>{int64_t{3}, int64_t{6}}, DimensionType::Integer),
            Exclusive(0, std::vector<Value>{int64_t{5}, int64_t{6}}, DimensionType::Integer)
        ), integer_space());

        REQUIRE(set.validate_sample({Value{int64_t{4}}}));
        REQUIRE_FALSE(set.validate_sample({Value{int64_t{3}}}));
    }

    SECTION("Dimensions combine with AND") {
        std::vector<DimensionPtr> dims;
        dims.push_back(std::make_unique<Integer>(1, 10));
        dims.push_back(std::make_unique<Categorical>(std::vector<Value>{"a", "b", "c"}));
        ConstraintSet set(make_list(
            Single(0, Value{int64_t{5}}, DimensionType::Integer),
            Inclusive(1, std::vector<Value>{"a", "b"}, DimensionType::Categorical)
        ), make_space(std::move(dims)));

        REQUIRE(set.validate_sample({Value{int64_t{5}}, Value{std::string("a")}}));
        REQUIRE_FALSE(set.validate_sample({Value{int64_t{4}}, Value{std::string("a")}}));
        REQUIRE_FALSE(set.validate_sample({Value{int64_t{5}}, Value{std::string("c")}}));
    }

    SECTION("Unconstrained set accepts everything") {
        ConstraintSet set({}, real_space());
        REQUIRE(set.validate_sample({Value{0.0}}));
        REQUIRE(set.validate_sample({Value{9.99}}));
    }

    SECTION("Too many coordinates") {
        ConstraintSet set({}, real_space());
        REQUIRE_THROWS_AS(set.validate_sample({Value{0.0}, Value{1.0}}), ConstraintIndexError);
    }
}

TEST_CASE("ConstraintSet equality and copies", "[constraint_set]") {
    auto build = [](double high) {
        return ConstraintSet(make_list(
            Inclusive(0, std::vector<Value>{0.0, high}, DimensionType::Real),
            Exclusive(0, std::vector<Value>{0.5, 0.6}, DimensionType::Real)
        ), real_space());
    };

    SECTION("Equal lists") {
        REQUIRE(build(1.0) == build(1.0));
        REQUIRE(build(1.0) != build(2.0));
    }

    SECTION("Order matters") {
        ConstraintSet reversed(make_list(
            Exclusive(0, std::vector<Value>{0.5, 0.6}, DimensionType::Real),
            Inclusive(0, std::vector<Value>{0.0, 1.0}, DimensionType::Real)
        ), real_space());
        REQUIRE(build(1.0) != reversed);
    }

    SECTION("Copy rebuilds the indexes") {
        ConstraintSet original = build(1.0);
        ConstraintSet copy = original;
        REQUIRE(copy == original);
        REQUIRE(copy.inclusive(0).size() == 1);
        REQUIRE(copy.inclusive(0)[0] != original.inclusive(0)[0]);
        REQUIRE(copy.validate_sample({Value{0.2}}));
        REQUIRE_FALSE(copy.validate_sample({Value{0.55}}));
    }

    SECTION("Printable form") {
        REQUIRE(build(1.0).to_string() ==
                "ConstraintSet([Inclusive(dimension=0, bounds=(0.0, 1.0), dimension_type=real), "
                "Exclusive(dimension=0, bounds=(0.5, 0.6), dimension_type=real)])");
    }
}
