// modules/evaluator/statechart_evaluator.h
#ifndef MOTIONCHART_MODULES_EVALUATOR_STATECHART_EVALUATOR_H
#define MOTIONCHART_MODULES_EVALUATOR_STATECHART_EVALUATOR_H

#include "core/types/budget.h"
#include "core/types/node.h"
#include "modules/budget/budget_controller.h"
#include "modules/lifecycle/transition.h"
#include "modules/observation/observation_registry.h"
#include "modules/registry/node_registry.h"
#include "modules/trace/trace_exporter.h"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace motionchart {

// Drives the statechart one tick at a time.
//
// Each tick: resolve world observations, snapshot every node's state,
// compute all transitions against that snapshot, then apply them together.
// A node evaluated first never sees a sibling's state from the same tick.
class StatechartEvaluator {
public:
    struct Config {
        std::optional<TickBudget> budget;
        // Episode succeeds when this node ends; otherwise when every task ended.
        std::optional<NodeName> termination_node;
        std::string episode_id = "episode-default";
        bool trace = true;
        bool verbose = false;
        // Observations are pushed through NodeRegistry::set_observation
        bool pushed_observations = false;
        Config() = default;
    };

    struct TickResult {
        int tick = 0;
        std::set<NodeName> running;
        std::vector<Transition> transitions;
    };

    // run() 在没有配置预算时使用的上限
    static constexpr int kDefaultMaxTicks = 10000;

    StatechartEvaluator(NodeRegistry& registry, const ObservationRegistry& observations);
    StatechartEvaluator(NodeRegistry& registry, const ObservationRegistry& observations, Config config);

    // Construction-time checks, also run automatically before the first tick:
    // unresolved references, goals without tasks, unknown termination node.
    void validate() const;

    TickResult tick();

    EpisodeResult run();

    // From the next tick on, every RUNNING / PAUSED node ends and nothing starts.
    void request_cancel() { cancel_requested_ = true; }
    bool cancelled() const { return cancel_applied_; }

    // Running tasks carrying a constraint expression
    std::vector<const Task*> active_constraints() const;

    bool is_finished() const;
    int tick_count() const { return tick_count_; }

    const TraceExporter& get_trace_exporter() const { return trace_exporter_; }
    const BudgetController& get_budget_controller() const { return budget_controller_; }

private:
    NodeRegistry& registry_;
    const ObservationRegistry& observations_;
    Config config_;
    BudgetController budget_controller_;
    TraceExporter trace_exporter_;
    int tick_count_ = 0;
    bool validated_ = false;
    bool cancel_requested_ = false;
    bool cancel_applied_ = false;

    void begin_episode();
    void resolve_observations();
    void validate_condition(const GraphNode& node, const char* slot, const Condition& condition) const;
    std::map<NodeName, LifecycleState> collect_states() const;
};

// One tick over a bare registry: no observation providers, no trace.
// Returns the names of the nodes RUNNING after the tick.
std::set<NodeName> tick(NodeRegistry& registry);

} // namespace motionchart

#endif // MOTIONCHART_MODULES_EVALUATOR_STATECHART_EVALUATOR_H
