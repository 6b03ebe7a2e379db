#include "module.hpp"

namespace substrate {

std::string state_to_string(CognitiveState state) {
    switch (state) {
        case CognitiveState::Idle:       return "idle";
        case CognitiveState::Processing: return "processing";
    }
    return "idle";
}

nlohmann::json Response::to_json() const {
    return {
        {"content", content},
        {"confidence", confidence},
        {"source_module", source_module},
        {"metadata", metadata}
    };
}

} // namespace substrate
