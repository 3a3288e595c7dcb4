#pragma once
// Umbrella header to simplify includes from bindings and examples.

// Core
#include "repro/core/rng.hpp"
#include "repro/core/errors.hpp"
#include "repro/core/streams.hpp"
#include "repro/core/backend.hpp"

// Scoped randomness
#include "repro/random/random_state.hpp"
#include "repro/random/random_context.hpp"
#include "repro/random/reproducible.hpp"

// End of umbrella
