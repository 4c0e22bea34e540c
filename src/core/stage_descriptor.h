#pragma once

#include "types.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nanoflow::core {

// One pipeline stage: an ordered list of tool invocations run inside a
// single runtime context. Immutable once the registry is loaded.
struct StageDescriptor {
    std::string name;                       // "convert-format", "basecall", ...
    size_t ordinal = 0;                     // Position in declared order, from 0
    std::string context_id;
    std::vector<CommandTemplate> steps;
    std::vector<std::string> inputs;        // Artifact names consumed
    std::vector<std::string> outputs;       // Artifact names produced

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["name"] = name;
        j["ordinal"] = ordinal;
        j["context"] = context_id;
        j["inputs"] = inputs;
        j["outputs"] = outputs;
        j["steps"] = nlohmann::json::array();
        for (const auto& step : steps) {
            j["steps"].push_back(step.to_json());
        }
        return j;
    }
};

} // namespace nanoflow::core
