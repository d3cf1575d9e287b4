// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace motionchart {

TraceExporter::TraceExporter(std::string episode_id)
    : episode_id_(std::move(episode_id)) {}

void TraceExporter::on_tick_start(int tick) {
    current_tick_ = tick;
}

void TraceExporter::on_transition(const GraphNode& node, LifecycleState from, LifecycleState to) {
    TraceRecord record;
    record.episode_id = episode_id_;
    record.tick = current_tick_;
    record.node_name = node.name;
    record.type = to_string(node.kind);
    record.from = from;
    record.to = to;
    record.timestamp = std::chrono::system_clock::now();
    record.metadata = node.metadata;
    traces_.push_back(std::move(record));
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    return traces_;
}

nlohmann::json TraceExporter::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& record : traces_) {
        arr.push_back(serialize_record(record));
    }
    return arr;
}

void TraceExporter::export_to_file(const std::string& file_path) const {
    std::ofstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open trace file: " + file_path);
    }
    file << to_json().dump(2) << std::endl;
}

nlohmann::json TraceExporter::serialize_record(const TraceRecord& record) {
    nlohmann::json obj;
    obj["episode_id"] = record.episode_id;
    obj["tick"] = record.tick;
    obj["node"] = record.node_name;
    obj["type"] = record.type;
    obj["from"] = to_string(record.from);
    obj["to"] = to_string(record.to);
    obj["timestamp_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()).count();
    if (!record.metadata.empty()) {
        obj["metadata"] = record.metadata;
    }
    return obj;
}

} // namespace motionchart
