// modules/lifecycle/transition.cpp
#include "modules/lifecycle/transition.h"

namespace motionchart {

LifecycleState next_lifecycle_state(LifecycleState current, const TransitionInputs& inputs) {
    if (current == LifecycleState::ENDED) {
        return current;
    }
    if (inputs.end && (current == LifecycleState::RUNNING || current == LifecycleState::PAUSED)) {
        return LifecycleState::ENDED;
    }
    if (current == LifecycleState::DORMANT && inputs.start) {
        return LifecycleState::RUNNING;
    }
    if (current == LifecycleState::RUNNING && inputs.pause) {
        return LifecycleState::PAUSED;
    }
    if (current == LifecycleState::PAUSED && !inputs.pause) {
        return LifecycleState::RUNNING;
    }
    return current;
}

} // namespace motionchart
