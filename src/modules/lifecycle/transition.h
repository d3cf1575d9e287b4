// modules/lifecycle/transition.h
#ifndef MOTIONCHART_MODULES_LIFECYCLE_TRANSITION_H
#define MOTIONCHART_MODULES_LIFECYCLE_TRANSITION_H

#include "core/types/lifecycle.h"

namespace motionchart {

// 某节点三个条件在当前 tick 的求值结果
struct TransitionInputs {
    bool start = false;
    bool pause = false;
    bool end = false;
};

// One applied state change, reported by the evaluator.
struct Transition {
    NodeName node;
    LifecycleState from;
    LifecycleState to;
};

// Lifecycle rule, first match wins:
//   ENDED                                -> no transition
//   end   && (RUNNING || PAUSED)         -> ENDED
//   start && DORMANT                     -> RUNNING
//   pause && RUNNING                     -> PAUSED
//   !pause && PAUSED                     -> RUNNING
LifecycleState next_lifecycle_state(LifecycleState current, const TransitionInputs& inputs);

} // namespace motionchart

#endif // MOTIONCHART_MODULES_LIFECYCLE_TRANSITION_H
