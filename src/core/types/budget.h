#ifndef MOTIONCHART_TYPES_BUDGET_H
#define MOTIONCHART_TYPES_BUDGET_H

#include "lifecycle.h" // 引入 NodeName, LifecycleState
#include <chrono>
#include <map>
#include <string>

namespace motionchart {

// 单次运动执行（episode）的预算
struct TickBudget {
    int max_ticks = -1;        // -1 表示无限制
    int max_duration_ms = -1;

    int ticks_used = 0;
    std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();

    bool exceeded() const {
        // 与 try_consume_tick 同一边界：用完即超限
        if (max_ticks >= 0 && ticks_used >= max_ticks) return true;
        if (max_duration_ms >= 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time).count();
            if (elapsed >= max_duration_ms) return true;
        }
        return false;
    }

    bool try_consume_tick() {
        if (max_ticks >= 0 && ticks_used >= max_ticks) return false; // Would exceed
        if (max_duration_ms >= 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time).count();
            if (elapsed >= max_duration_ms) return false;
        }
        ++ticks_used;
        return true;
    }
};

// Outcome of StatechartEvaluator::run()
struct EpisodeResult {
    bool success = false;
    std::string message;
    int ticks = 0;
    std::map<NodeName, LifecycleState> final_states;
};

} // namespace motionchart

#endif // MOTIONCHART_TYPES_BUDGET_H
