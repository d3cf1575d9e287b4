// modules/observation/observation_registry.cpp
#include "modules/observation/observation_registry.h"
#include "core/types/errors.h"
#include <algorithm>

namespace motionchart {

bool ObservationRegistry::has_observation(const std::string& name) const {
    return observations_.find(name) != observations_.end();
}

bool ObservationRegistry::observe(const std::string& name) const {
    auto it = observations_.find(name);
    if (it == observations_.end()) {
        throw UnresolvedReferenceError(name, "no observation provider registered");
    }
    return it->second();
}

std::vector<std::string> ObservationRegistry::list_observations() const {
    std::vector<std::string> names;
    names.reserve(observations_.size());
    for (const auto& [name, fn] : observations_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace motionchart
