// modules/budget/budget_controller.cpp
#include "modules/budget/budget_controller.h"
#include <algorithm>
#include <chrono>

namespace motionchart {

BudgetController::BudgetController(std::optional<TickBudget> initial_budget)
    : budget_opt_(std::move(initial_budget)) {
    if (budget_opt_.has_value()) {
        budget_opt_->ticks_used = 0;
        budget_opt_->start_time = std::chrono::steady_clock::now();
    }
}

bool BudgetController::try_consume_tick() {
    if (!budget_opt_.has_value()) {
        // 没有预算限制，总是成功
        return true;
    }
    return budget_opt_->try_consume_tick();
}

bool BudgetController::exceeded() const {
    if (!budget_opt_.has_value()) {
        return false;
    }
    return budget_opt_->exceeded();
}

int BudgetController::ticks_used() const {
    return budget_opt_.has_value() ? budget_opt_->ticks_used : 0;
}

std::optional<int> BudgetController::remaining_ticks() const {
    if (!budget_opt_.has_value() || budget_opt_->max_ticks < 0) {
        return std::nullopt;
    }
    return std::max(0, budget_opt_->max_ticks - budget_opt_->ticks_used);
}

long long BudgetController::elapsed_ms() const {
    if (!budget_opt_.has_value()) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - budget_opt_->start_time).count();
}

const std::optional<TickBudget>& BudgetController::get_budget() const {
    return budget_opt_;
}

void BudgetController::set_budget(std::optional<TickBudget> budget) {
    budget_opt_ = std::move(budget);
    if (budget_opt_.has_value()) {
        budget_opt_->ticks_used = 0;
        budget_opt_->start_time = std::chrono::steady_clock::now();
    }
}

} // namespace motionchart
