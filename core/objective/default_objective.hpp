#pragma once

#include "objective/objective.hpp"

namespace hegel {

/// "molecular_identity_validation": confidence 0.3, uncertainty 0.2,
/// consistency 0.25, conflicts 0.15, coherence 0.1.
ObjectiveFunction makeMolecularIdentityObjective();

} // namespace hegel
