// motionchart/engine.h
#ifndef MOTIONCHART_ENGINE_H
#define MOTIONCHART_ENGINE_H

#include "modules/evaluator/statechart_evaluator.h"
#include "modules/observation/observation_registry.h"
#include "modules/parser/statechart_parser.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace motionchart {

struct EngineConfig {
    std::optional<TickBudget> budget;
    bool trace = true;
    std::string trace_path; // 为空则不导出
    bool verbose = false;
};

// Reads max_ticks, max_duration_ms, trace, trace_path, verbose from a JSON file.
// Missing file or malformed entries fall back to defaults.
EngineConfig load_engine_config(const std::string& config_path = "motionchart_config.json");

class StatechartEngine {
public:
    static std::unique_ptr<StatechartEngine> from_yaml(const std::string& yaml_content,
                                                       EngineConfig config = EngineConfig{});
    static std::unique_ptr<StatechartEngine> from_file(const std::string& file_path,
                                                       EngineConfig config = EngineConfig{});

    StatechartEngine(ParsedStatechart statechart, EngineConfig config);

    StatechartEngine(const StatechartEngine&) = delete;
    StatechartEngine& operator=(const StatechartEngine&) = delete;

    template <typename Func>
    void register_observation(std::string_view name, Func&& func) {
        observations_.register_observation(std::string(name), std::forward<Func>(func));
    }

    void validate() const { evaluator_->validate(); }
    StatechartEvaluator::TickResult tick();
    EpisodeResult run();
    void request_cancel() { evaluator_->request_cancel(); }

    NodeRegistry& registry() { return statechart_.registry; }
    const NodeRegistry& registry() const { return statechart_.registry; }
    ObservationRegistry& observations() { return observations_; }
    StatechartEvaluator& evaluator() { return *evaluator_; }

    std::vector<TraceRecord> get_last_traces() const { return last_traces_; }

private:
    ParsedStatechart statechart_;
    EngineConfig config_;
    ObservationRegistry observations_;
    std::unique_ptr<StatechartEvaluator> evaluator_;
    std::vector<TraceRecord> last_traces_;
};

} // namespace motionchart

#endif // MOTIONCHART_ENGINE_H
