// src/core/engine.cpp
#include "motionchart/engine.h"
#include "core/types/errors.h"
#include <fstream>
#include <iostream>
#include <sstream>

namespace motionchart {

EngineConfig load_engine_config(const std::string& config_path) {
    EngineConfig config;

    std::ifstream file(config_path);
    if (!file.is_open()) {
        return config;
    }

    try {
        nlohmann::json j;
        file >> j;

        TickBudget budget;
        bool has_budget = false;
        if (j.contains("max_ticks") && j["max_ticks"].is_number_integer()) {
            budget.max_ticks = j["max_ticks"].get<int>();
            has_budget = true;
        }
        if (j.contains("max_duration_ms") && j["max_duration_ms"].is_number_integer()) {
            budget.max_duration_ms = j["max_duration_ms"].get<int>();
            has_budget = true;
        }
        if (has_budget) {
            config.budget = budget;
        }

        if (j.contains("trace") && j["trace"].is_boolean()) {
            config.trace = j["trace"].get<bool>();
        }
        if (j.contains("trace_path") && j["trace_path"].is_string()) {
            config.trace_path = j["trace_path"].get<std::string>();
        }
        if (j.contains("verbose") && j["verbose"].is_boolean()) {
            config.verbose = j["verbose"].get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[WARNING] Ignoring malformed config " << config_path << ": " << e.what() << std::endl;
        return EngineConfig{};
    }

    return config;
}

std::unique_ptr<StatechartEngine> StatechartEngine::from_yaml(const std::string& yaml_content, EngineConfig config) {
    StatechartParser parser;
    auto statechart = parser.parse_from_string(yaml_content);
    return std::make_unique<StatechartEngine>(std::move(statechart), std::move(config));
}

std::unique_ptr<StatechartEngine> StatechartEngine::from_file(const std::string& file_path, EngineConfig config) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw StatechartParseError("Cannot open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_yaml(buffer.str(), std::move(config));
}

StatechartEngine::StatechartEngine(ParsedStatechart statechart, EngineConfig config)
    : statechart_(std::move(statechart)), config_(std::move(config)) {
    StatechartEvaluator::Config eval_config;
    // 文档内的预算优先
    eval_config.budget = statechart_.budget.has_value() ? statechart_.budget : config_.budget;
    eval_config.termination_node = statechart_.termination_node;
    eval_config.trace = config_.trace;
    eval_config.verbose = config_.verbose;
    evaluator_ = std::make_unique<StatechartEvaluator>(statechart_.registry, observations_, eval_config);

    if (config_.verbose) {
        std::cout << "[DEBUG] Nodes loaded: " << statechart_.registry.size() << std::endl;
        for (const auto& node : statechart_.registry.nodes()) {
            std::cout << "[DEBUG]   - " << node->name << " (" << to_string(node->kind) << ")" << std::endl;
        }
    }
}

StatechartEvaluator::TickResult StatechartEngine::tick() {
    auto result = evaluator_->tick();
    last_traces_ = evaluator_->get_trace_exporter().get_traces();
    return result;
}

EpisodeResult StatechartEngine::run() {
    auto result = evaluator_->run();
    last_traces_ = evaluator_->get_trace_exporter().get_traces();

    if (config_.trace && !config_.trace_path.empty()) {
        evaluator_->get_trace_exporter().export_to_file(config_.trace_path);
    }
    return result;
}

} // namespace motionchart
