// modules/observation/observation_registry.h
#ifndef MOTIONCHART_MODULES_OBSERVATION_OBSERVATION_REGISTRY_H
#define MOTIONCHART_MODULES_OBSERVATION_OBSERVATION_REGISTRY_H

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace motionchart {

// 世界状态提供者：在 tick 开始前被解析为 bool
using ObservationFunction = std::function<bool()>;

class ObservationRegistry {
public:
    ObservationRegistry() = default;

    template <typename Func>
    void register_observation(std::string name, Func&& func) {
        observations_[std::move(name)] = std::forward<Func>(func);
    }

    bool has_observation(const std::string& name) const;

    // Throws UnresolvedReferenceError for an unknown name
    bool observe(const std::string& name) const;

    std::vector<std::string> list_observations() const;

private:
    std::unordered_map<std::string, ObservationFunction> observations_;
};

} // namespace motionchart

#endif // MOTIONCHART_MODULES_OBSERVATION_OBSERVATION_REGISTRY_H
