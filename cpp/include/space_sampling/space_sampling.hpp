#pragma once

// Core types
#include "core/value.hpp"
#include "core/errors.hpp"

// Random number generation
#include "random/rng.hpp"

// Search space
#include "space/dimension.hpp"
#include "space/space.hpp"

// Constraints and constrained sampling
#include "constraints/constraint.hpp"
#include "constraints/check.hpp"
#include "constraints/constraint_set.hpp"
