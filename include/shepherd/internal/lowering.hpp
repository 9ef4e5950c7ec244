#pragma once

#include "shepherd/internal/backend.hpp"
#include "shepherd/process_spec.hpp"
#include "shepherd/result.hpp"

namespace shepherd::internal {

// Merges the spec's environment overrides over the current process environment.
Result<SpawnSpec> lower_spec(const ProcessSpec& spec);

}  // namespace shepherd::internal
