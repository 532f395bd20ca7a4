#include "objective/default_objective.hpp"
#include "objective/objective_components.hpp"

namespace hegel {

ObjectiveFunction makeMolecularIdentityObjective() {
    ObjectiveFunction objective("molecular_identity_validation");
    objective.addComponent(std::make_unique<ConfidenceObjective>("confidence"), 0.3);
    objective.addComponent(std::make_unique<UncertaintyObjective>("uncertainty"), 0.2);
    objective.addComponent(std::make_unique<ConsistencyObjective>("consistency"), 0.25);
    objective.addComponent(std::make_unique<ConflictObjective>("conflicts"), 0.15);
    objective.addComponent(std::make_unique<CoherenceObjective>("coherence"), 0.1);
    return objective;
}

} // namespace hegel
