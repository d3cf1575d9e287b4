// modules/evaluator/statechart_evaluator.cpp
#include "modules/evaluator/statechart_evaluator.h"
#include "modules/goal/goal.h"
#include "core/types/errors.h"
#include <algorithm>
#include <iostream>
#include <unordered_map>

namespace motionchart {

StatechartEvaluator::StatechartEvaluator(NodeRegistry& registry, const ObservationRegistry& observations)
    : StatechartEvaluator(registry, observations, Config{}) {}

StatechartEvaluator::StatechartEvaluator(NodeRegistry& registry,
                                         const ObservationRegistry& observations,
                                         Config config)
    : registry_(registry),
      observations_(observations),
      config_(std::move(config)),
      budget_controller_(config_.budget),
      trace_exporter_(config_.episode_id) {}

void StatechartEvaluator::validate_condition(const GraphNode& node, const char* slot, const Condition& condition) const {
    for (const auto& [name, predicate] : condition.references()) {
        const GraphNode* target = registry_.find(name);
        if (target == nullptr) {
            throw UnresolvedReferenceError(name, std::string(slot) + " condition of node " + node.name);
        }
        if (predicate == Predicate::IS_OBSERVED && !config_.pushed_observations &&
            !observations_.has_observation(target->observation)) {
            std::cerr << "[WARNING] Observation '" << target->observation << "' of node " << name
                      << " has no provider; it stays at its last pushed value." << std::endl;
        }
    }
}

void StatechartEvaluator::validate() const {
    for (const auto& node_ptr : registry_.nodes()) {
        validate_condition(*node_ptr, "start", node_ptr->start_condition);
        validate_condition(*node_ptr, "pause", node_ptr->pause_condition);
        validate_condition(*node_ptr, "end", node_ptr->end_condition);

        if (const auto* goal = dynamic_cast<const Goal*>(node_ptr.get())) {
            goal->check_tasks();
        }
    }
    if (config_.termination_node.has_value() && !registry_.contains(config_.termination_node.value())) {
        throw UnresolvedReferenceError(config_.termination_node.value(), "termination node");
    }
}

void StatechartEvaluator::resolve_observations() {
    // 每个观测键每 tick 只调用一次提供者，共享同一键的节点看到同一个值
    std::unordered_map<std::string, bool> resolved;
    for (const auto& node_ptr : registry_.nodes()) {
        if (node_ptr->is_ended() || !observations_.has_observation(node_ptr->observation)) {
            continue;
        }
        auto it = resolved.find(node_ptr->observation);
        if (it == resolved.end()) {
            it = resolved.emplace(node_ptr->observation, observations_.observe(node_ptr->observation)).first;
        }
        node_ptr->observed_ = it->second;
    }
}

void StatechartEvaluator::begin_episode() {
    if (validated_) {
        return;
    }
    validate();
    validated_ = true;
    // Wall-time budget counts from the first tick, not from construction
    budget_controller_.set_budget(budget_controller_.get_budget());
}

StatechartEvaluator::TickResult StatechartEvaluator::tick() {
    begin_episode();
    registry_.freeze();

    ++tick_count_;
    if (config_.trace) {
        trace_exporter_.on_tick_start(tick_count_);
    }

    // 1. 世界状态先解析成 bool
    resolve_observations();
    // 2. 上一 tick 的状态快照
    const StateSnapshot snapshot = registry_.snapshot();

    // 3. 全部节点基于同一快照计算下一状态
    const bool cancelling = cancel_requested_;
    std::vector<Transition> transitions;
    for (const auto& node_ptr : registry_.nodes()) {
        const LifecycleState current = node_ptr->state();
        LifecycleState next = current;
        if (cancelling) {
            // 取消时结束条件视为真，DORMANT 节点不再启动
            if (current != LifecycleState::DORMANT) {
                next = next_lifecycle_state(current, TransitionInputs{false, false, true});
            }
        } else {
            next = node_ptr->compute_next_state(snapshot);
        }
        if (next != current) {
            transitions.push_back(Transition{node_ptr->name, current, next});
        }
    }

    // 4. 统一应用
    for (const auto& t : transitions) {
        GraphNode& node = registry_.resolve(t.node);
        node.state_ = t.to;
        if (config_.trace) {
            trace_exporter_.on_transition(node, t.from, t.to);
        }
        if (config_.verbose) {
            std::cout << "[DEBUG] Tick " << tick_count_ << ": " << t.node << " "
                      << to_string(t.from) << " -> " << to_string(t.to) << std::endl;
        }
    }
    if (cancelling) {
        cancel_applied_ = true;
    }

    return TickResult{tick_count_, registry_.running_set(), std::move(transitions)};
}

EpisodeResult StatechartEvaluator::run() {
    begin_episode();
    if (!budget_controller_.get_budget().has_value()) {
        TickBudget fallback;
        fallback.max_ticks = kDefaultMaxTicks;
        budget_controller_.set_budget(fallback);
    }

    EpisodeResult result;
    while (true) {
        if (cancel_applied_) {
            result.success = false;
            result.message = "Episode cancelled at tick " + std::to_string(tick_count_);
            break;
        }
        // A pending cancel still gets its tick, even when the graph is done
        if (!cancel_requested_ && is_finished()) {
            result.success = true;
            result.message = "Episode finished after " + std::to_string(tick_count_) + " ticks";
            break;
        }
        if (!budget_controller_.try_consume_tick()) {
            result.success = false;
            result.message = "Tick budget exhausted after " + std::to_string(tick_count_) + " ticks (" +
                             std::to_string(budget_controller_.elapsed_ms()) + " ms)";
            break;
        }
        tick();
    }

    result.ticks = tick_count_;
    result.final_states = collect_states();
    if (config_.verbose) {
        std::cout << "[DEBUG] " << result.message << std::endl;
    }
    return result;
}

std::vector<const Task*> StatechartEvaluator::active_constraints() const {
    std::vector<const Task*> active;
    for (const Task* task : registry_.nodes_of_type<Task>()) {
        if (task->contributes_constraint()) {
            active.push_back(task);
        }
    }
    return active;
}

bool StatechartEvaluator::is_finished() const {
    if (config_.termination_node.has_value()) {
        return registry_.resolve(config_.termination_node.value()).is_ended();
    }
    const auto tasks = registry_.nodes_of_type<Task>();
    if (tasks.empty()) {
        return registry_.all_ended();
    }
    return std::all_of(tasks.begin(), tasks.end(), [](const Task* t) { return t->is_ended(); });
}

std::map<NodeName, LifecycleState> StatechartEvaluator::collect_states() const {
    std::map<NodeName, LifecycleState> states;
    for (const auto& node_ptr : registry_.nodes()) {
        states[node_ptr->name] = node_ptr->state();
    }
    return states;
}

std::set<NodeName> tick(NodeRegistry& registry) {
    ObservationRegistry no_providers;
    StatechartEvaluator::Config config;
    config.trace = false;
    config.pushed_observations = true;
    StatechartEvaluator evaluator(registry, no_providers, config);
    return evaluator.tick().running;
}

} // namespace motionchart
