// modules/trace/trace_exporter.h
#ifndef MOTIONCHART_MODULES_TRACE_TRACE_EXPORTER_H
#define MOTIONCHART_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/lifecycle.h" // 引入 NodeName, LifecycleState
#include "core/types/node.h"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>
#include <chrono>

namespace motionchart {

struct TraceRecord {
    std::string episode_id;
    int tick = 0;
    NodeName node_name;
    std::string type; // "task", "monitor", "goal"
    LifecycleState from = LifecycleState::DORMANT;
    LifecycleState to = LifecycleState::DORMANT;
    std::chrono::system_clock::time_point timestamp;
    nlohmann::json metadata; // 节点原始 metadata
};

class TraceExporter {
public:
    explicit TraceExporter(std::string episode_id = "episode-default");

    void on_tick_start(int tick);

    void on_transition(const GraphNode& node, LifecycleState from, LifecycleState to);

    std::vector<TraceRecord> get_traces() const;

    nlohmann::json to_json() const;

    // Throws std::runtime_error when the file cannot be written
    void export_to_file(const std::string& file_path) const;

private:
    std::vector<TraceRecord> traces_;
    std::string episode_id_;
    int current_tick_ = 0;

    static nlohmann::json serialize_record(const TraceRecord& record);
};

} // namespace motionchart

#endif // MOTIONCHART_MODULES_TRACE_TRACE_EXPORTER_H
