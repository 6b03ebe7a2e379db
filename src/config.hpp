#pragma once
#include "status.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace substrate {

struct MemoryConfig {
    uint32_t stm_capacity = 7;
    uint32_t ltm_capacity = 1000;
    double promotion_threshold = 0.5;   // promote iff importance > threshold
    double default_importance = 0.5;    // used by process() and store() without importance
    uint32_t similar_limit = 5;         // find_similar() cap inside process()
    double reinforce_factor = 1.2;
    uint32_t reinforce_window = 3;      // newest N short-term items touched by "reinforce"
};

// Checks every field. Returns InvalidConfiguration naming the first bad one.
Status validate(const MemoryConfig& cfg);

struct Config {
    std::string module = "memory";      // registry name of the module to create
    std::string name = "MemorySystem";  // instance name, reported as source_module
    MemoryConfig memory;

    // Load from $SUBSTRATE_CONFIG or ~/.substrate/config.json + env vars.
    // Never fails: missing or malformed input falls back to defaults.
    static Config load();

    // Parse a JSON document. Wrongly-typed or invalid fields keep their
    // defaults (with a warning for invalid values).
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    nlohmann::json to_json() const;

    // Path load() reads from.
    static std::string config_path();
};

} // namespace substrate
