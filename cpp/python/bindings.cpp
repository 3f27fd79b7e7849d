#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <optional>

#include "space_sampling/space_sampling.hpp"

namespace py = pybind11;

namespace {

// Python holds its own copies; the C++ side always receives clones
std::vector<space_sampling::DimensionPtr> clone_dimensions(const py::list& dimensions) {
    std::vector<space_sampling::DimensionPtr> out;
    out.reserve(dimensions.size());
    for (const auto& item : dimensions) {
        out.push_back(item.cast<const space_sampling::Dimension&>().clone());
    }
    return out;
}

std::vector<space_sampling::ConstraintPtr> clone_constraints(const py::list& constraints) {
    std::vector<space_sampling::ConstraintPtr> out;
    out.reserve(constraints.size());
    for (const auto& item : constraints) {
        if (item.is_none()) {
            throw space_sampling::ConstraintTypeError("Constraint can not be None");
        }
        if (!py::isinstance<space_sampling::Constraint>(item)) {
            throw space_sampling::ConstraintTypeError(
                "Constraints must be of type \"Single\", \"Exclusive\" or \"Inclusive\". Got " +
                std::string(py::str(py::type::of(item)))
            );
        }
        out.push_back(item.cast<const space_sampling::Constraint&>().clone());
    }
    return out;
}

// pybind11 converts True/False to int64_t; constraint values keep their Python type
space_sampling::Value to_value(const py::handle& value) {
    if (py::isinstance<py::bool_>(value)) {
        throw space_sampling::ConstraintTypeError("Constraint values can not be of type bool. Got " +
                                                  std::string(py::repr(value)));
    }
    return value.cast<space_sampling::Value>();
}

std::vector<space_sampling::Value> to_values(const py::sequence& values) {
    std::vector<space_sampling::Value> out;
    out.reserve(values.size());
    for (const auto& item : values) {
        out.push_back(to_value(item));
    }
    return out;
}

// random_state accepts None, an int seed or an RNG instance
std::vector<space_sampling::Point> sample(
    const space_sampling::ConstraintSet& self,
    size_t n_samples,
    const py::object& random_state
) {
    if (random_state.is_none()) {
        return self.rvs(n_samples, std::nullopt);
    }
    if (py::isinstance<space_sampling::RNG>(random_state)) {
        return self.rvs(n_samples, random_state.cast<space_sampling::RNG&>());
    }
    return self.rvs(n_samples, std::optional<uint64_t>(random_state.cast<uint64_t>()));
}

}  // namespace

PYBIND11_MODULE(space_sampling_cpp, m) {
    m.doc() = "C++ implementation of constrained sampling of search spaces";

    py::register_exception<space_sampling::ConstraintTypeError>(m, "ConstraintTypeError", PyExc_TypeError);
    py::register_exception<space_sampling::ConstraintValueError>(m, "ConstraintValueError", PyExc_ValueError);
    py::register_exception<space_sampling::ConstraintIndexError>(m, "ConstraintIndexError", PyExc_IndexError);
    py::register_exception<space_sampling::SamplingError>(m, "SamplingError", PyExc_RuntimeError);

    // RNG
    py::class_<space_sampling::RNG>(m, "RNG")
        .def(py::init<>())
        .def(py::init<uint64_t>())
        .def("uniform", py::overload_cast<>(&space_sampling::RNG::uniform))
        .def("uniform", py::overload_cast<double, double>(&space_sampling::RNG::uniform))
        .def("randint", &space_sampling::RNG::randint);

    // Dimensions
    py::class_<space_sampling::Dimension>(m, "Dimension")
        .def("rvs", [](const space_sampling::Dimension& self, size_t n_samples, space_sampling::RNG& rng) {
            return self.rvs(n_samples, rng);
        }, py::arg("n_samples"), py::arg("rng"))
        .def("__repr__", &space_sampling::Dimension::to_string);

    py::class_<space_sampling::Real, space_sampling::Dimension>(m, "Real")
        .def(py::init<double, double>(), py::arg("low"), py::arg("high"))
        .def_property_readonly("low", &space_sampling::Real::low)
        .def_property_readonly("high", &space_sampling::Real::high);

    py::class_<space_sampling::Integer, space_sampling::Dimension>(m, "Integer")
        .def(py::init<int64_t, int64_t>(), py::arg("low"), py::arg("high"))
        .def_property_readonly("low", &space_sampling::Integer::low)
        .def_property_readonly("high", &space_sampling::Integer::high);

    py::class_<space_sampling::Categorical, space_sampling::Dimension>(m, "Categorical")
        .def(py::init<std::vector<space_sampling::Value>>(), py::arg("categories"))
        .def_property_readonly("categories", &space_sampling::Categorical::categories);

    // Space
    py::class_<space_sampling::Space>(m, "Space")
        .def(py::init([](const py::list& dimensions) {
            return space_sampling::Space(clone_dimensions(dimensions));
        }), py::arg("dimensions"))
        .def_property_readonly("n_dims", &space_sampling::Space::n_dims)
        .def("rvs", [](const space_sampling::Space& self, size_t n_samples, std::optional<uint64_t> seed) {
            space_sampling::RNG rng = space_sampling::make_rng(seed);
            return self.rvs(n_samples, rng);
        }, py::arg("n_samples") = 1, py::arg("random_state") = py::none())
        .def("__repr__", &space_sampling::Space::to_string);

    // Constraints
    py::class_<space_sampling::Constraint>(m, "Constraint")
        .def_property_readonly("dimension", &space_sampling::Constraint::dimension)
        .def_property_readonly("dimension_type", [](const space_sampling::Constraint& self) {
            return std::string(space_sampling::dimension_type_name(self.dimension_type()));
        })
        .def("validate", &space_sampling::Constraint::validate, py::arg("value"))
        .def("__eq__", [](const space_sampling::Constraint& self, const py::object& other) {
            if (!py::isinstance<space_sampling::Constraint>(other)) {
                return false;
            }
            return self.equals(other.cast<const space_sampling::Constraint&>());
        })
        .def("__repr__", &space_sampling::Constraint::to_string);

    py::class_<space_sampling::Single, space_sampling::Constraint>(m, "Single")
        .def(py::init([](int dimension, const py::object& value, const std::string& dimension_type) {
            return space_sampling::Single(dimension, to_value(value), dimension_type);
        }), py::arg("dimension"), py::arg("value"), py::arg("dimension_type"))
        .def_property_readonly("value", &space_sampling::Single::value);

    py::class_<space_sampling::BoundConstraint, space_sampling::Constraint>(m, "BoundConstraint")
        .def_property_readonly("bounds", &space_sampling::BoundConstraint::bounds);

    py::class_<space_sampling::Inclusive, space_sampling::BoundConstraint>(m, "Inclusive")
        .def(py::init([](int dimension, const py::sequence& bounds, const std::string& dimension_type) {
            return space_sampling::Inclusive(dimension, to_values(bounds), dimension_type);
        }), py::arg("dimension"), py::arg("bounds"), py::arg("dimension_type"));

    py::class_<space_sampling::Exclusive, space_sampling::BoundConstraint>(m, "Exclusive")
        .def(py::init([](int dimension, const py::sequence& bounds, const std::string& dimension_type) {
            return space_sampling::Exclusive(dimension, to_values(bounds), dimension_type);
        }), py::arg("dimension"), py::arg("bounds"), py::arg("dimension_type"));

    m.def("check_constraints", [](const space_sampling::Space& space, const py::list& constraints) {
        space_sampling::check_constraints(space, clone_constraints(constraints));
    }, py::arg("space"), py::arg("constraints"));

    // ConstraintSet
    py::class_<space_sampling::ConstraintSet::Config>(m, "SamplerConfig")
        .def(py::init<>())
        .def_readwrite("max_candidates", &space_sampling::ConstraintSet::Config::max_candidates)
        .def_readwrite("verbose", &space_sampling::ConstraintSet::Config::verbose);

    py::class_<space_sampling::ConstraintSet>(m, "ConstraintSet")
        .def(py::init([](const py::list& constraints, const space_sampling::Space& space) {
            return space_sampling::ConstraintSet(clone_constraints(constraints), space);
        }), py::arg("constraints_list"), py::arg("space"))
        .def("rvs", &sample, py::arg("n_samples") = 1, py::arg("random_state") = py::none())
        .def("validate_sample", &space_sampling::ConstraintSet::validate_sample, py::arg("sample"))
        .def_property("config",
            &space_sampling::ConstraintSet::config,
            &space_sampling::ConstraintSet::set_config)
        .def("__eq__", [](const space_sampling::ConstraintSet& self, const py::object& other) {
            if (!py::isinstance<space_sampling::ConstraintSet>(other)) {
                return false;
            }
            return self == other.cast<const space_sampling::ConstraintSet&>();
        })
        .def("__repr__", &space_sampling::ConstraintSet::to_string);
}
