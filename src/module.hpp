#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace substrate {

enum class CognitiveState { Idle, Processing };

std::string state_to_string(CognitiveState state);

// Result of a single process() call, as seen by the orchestrator.
struct Response {
    nlohmann::json content;
    double confidence = 0.0;       // [0, 1]
    std::string source_module;
    nlohmann::json metadata = nlohmann::json::object();

    nlohmann::json to_json() const;
};

// Capability contract shared by every cognitive module (memory, reasoning,
// learning, coordination). The orchestrator only talks to modules through
// this interface.
class CognitiveModule {
public:
    virtual ~CognitiveModule() = default;

    virtual std::string name() const = 0;
    virtual CognitiveState state() const = 0;

    // Total: never fails for well-typed input.
    virtual Response process(const nlohmann::json& input) = 0;

    // Unrecognized feedback keys are ignored.
    virtual void update(const nlohmann::json& feedback) = 0;
};

} // namespace substrate
