// main.cpp
#include <iostream>
#include <map>
#include <string>
#include "motionchart/engine.h"

// Simulated world: every motion needs a few ticks, a collision shows up once.
class SimulatedWorld {
public:
    bool progress(const std::string& motion, int ticks_needed) {
        return ++elapsed_[motion] >= ticks_needed;
    }

    bool collision(int tick) const { return tick >= 6 && tick < 9; }

private:
    std::map<std::string, int> elapsed_;
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <statechart.yaml> [config.json]\n";
        return 1;
    }

    try {
        // 1. 配置与引擎
        auto config = motionchart::load_engine_config(argc > 2 ? argv[2] : "motionchart_config.json");
        auto engine = motionchart::StatechartEngine::from_file(argv[1], config);
        engine->validate();

        // 2. 注册世界观测
        SimulatedWorld world;
        auto& registry = engine->registry();
        for (const auto& node : registry.nodes()) {
            if (node->kind != motionchart::NodeKind::TASK) continue;
            const std::string name = node->name;
            engine->register_observation(node->observation, [&world, &registry, name]() {
                // Only a running motion makes progress
                return registry.resolve(name).is_running() && world.progress(name, 3);
            });
        }
        engine->register_observation("collision_detected", [&world, &engine]() {
            return world.collision(engine->evaluator().tick_count() + 1);
        });

        // 3. 执行
        auto result = engine->run();

        // 4. 输出结果
        if (result.success) {
            std::cout << "[SUCCESS] " << result.message << "\n";
        } else {
            std::cerr << "[ERROR] " << result.message << "\n";
        }
        for (const auto& [name, state] : result.final_states) {
            std::cout << "  " << name << ": " << motionchart::to_string(state) << "\n";
        }

        auto traces = engine->get_last_traces();
        std::cout << "Trace: " << traces.size() << " transitions\n";
        for (const auto& tr : traces) {
            std::cout << "  [" << tr.tick << "] " << tr.node_name << " "
                      << motionchart::to_string(tr.from) << " -> " << motionchart::to_string(tr.to) << "\n";
        }

        return result.success ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
