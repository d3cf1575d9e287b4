// modules/budget/budget_controller.h
#ifndef MOTIONCHART_MODULES_BUDGET_BUDGET_CONTROLLER_H
#define MOTIONCHART_MODULES_BUDGET_BUDGET_CONTROLLER_H

#include "core/types/budget.h" // 引入 TickBudget
#include <optional>

namespace motionchart {

// Bounds the number of ticks and the wall time of one episode.
class BudgetController {
public:
    explicit BudgetController(std::optional<TickBudget> initial_budget = std::nullopt);

    // false 表示再执行一个 tick 会超出预算
    bool try_consume_tick();

    bool exceeded() const;

    int ticks_used() const;

    // nullopt when the tick count is unbounded
    std::optional<int> remaining_ticks() const;

    // Wall time since the budget was set; 0 without a budget
    long long elapsed_ms() const;

    const std::optional<TickBudget>& get_budget() const;

    // Resets the counters and the start time
    void set_budget(std::optional<TickBudget> budget);

private:
    std::optional<TickBudget> budget_opt_;
};

} // namespace motionchart

#endif // MOTIONCHART_MODULES_BUDGET_BUDGET_CONTROLLER_H
