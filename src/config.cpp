#include "config.hpp"
#include "util.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace substrate {

Status validate(const MemoryConfig& cfg) {
    if (cfg.stm_capacity == 0)
        return Status::invalid_configuration("stm_capacity must be at least 1");
    if (cfg.ltm_capacity == 0)
        return Status::invalid_configuration("ltm_capacity must be at least 1");
    if (!(cfg.promotion_threshold >= 0.0 && cfg.promotion_threshold <= 1.0))
        return Status::invalid_configuration("promotion_threshold must be within [0, 1]");
    if (!(cfg.default_importance >= 0.0 && cfg.default_importance <= 1.0))
        return Status::invalid_configuration("default_importance must be within [0, 1]");
    if (!(cfg.reinforce_factor >= 1.0) || !std::isfinite(cfg.reinforce_factor))
        return Status::invalid_configuration("reinforce_factor must be a finite value >= 1");
    if (cfg.reinforce_window == 0)
        return Status::invalid_configuration("reinforce_window must be at least 1");
    return Status::success();
}

nlohmann::json Config::defaults_json() {
    MemoryConfig m;
    return {
        {"module", "memory"},
        {"name", "MemorySystem"},
        {"memory", {
            {"stm_capacity", m.stm_capacity},
            {"ltm_capacity", m.ltm_capacity},
            {"promotion_threshold", m.promotion_threshold},
            {"default_importance", m.default_importance},
            {"similar_limit", m.similar_limit},
            {"reinforce_factor", m.reinforce_factor},
            {"reinforce_window", m.reinforce_window}
        }}
    };
}

nlohmann::json Config::to_json() const {
    return {
        {"module", module},
        {"name", name},
        {"memory", {
            {"stm_capacity", memory.stm_capacity},
            {"ltm_capacity", memory.ltm_capacity},
            {"promotion_threshold", memory.promotion_threshold},
            {"default_importance", memory.default_importance},
            {"similar_limit", memory.similar_limit},
            {"reinforce_factor", memory.reinforce_factor},
            {"reinforce_window", memory.reinforce_window}
        }}
    };
}

std::string Config::config_path() {
    if (const char* v = std::getenv("SUBSTRATE_CONFIG")) {
        if (*v) return expand_home(v);
    }
    return expand_home("~/.substrate/config.json");
}

// Field-by-field fallback: a value that fails validation is reset to its
// default so one bad key does not discard the rest of the file.
static void sanitize(MemoryConfig& m) {
    const MemoryConfig d;
    auto reset = [](auto& field, const auto& value, const char* key) {
        std::cerr << "[config] Invalid memory." << key << ", using default " << value << "\n";
        field = value;
    };
    auto in_unit = [](double v) { return v >= 0.0 && v <= 1.0; };

    if (m.stm_capacity == 0) reset(m.stm_capacity, d.stm_capacity, "stm_capacity");
    if (m.ltm_capacity == 0) reset(m.ltm_capacity, d.ltm_capacity, "ltm_capacity");
    if (!in_unit(m.promotion_threshold))
        reset(m.promotion_threshold, d.promotion_threshold, "promotion_threshold");
    if (!in_unit(m.default_importance))
        reset(m.default_importance, d.default_importance, "default_importance");
    if (!(m.reinforce_factor >= 1.0) || !std::isfinite(m.reinforce_factor))
        reset(m.reinforce_factor, d.reinforce_factor, "reinforce_factor");
    if (m.reinforce_window == 0)
        reset(m.reinforce_window, d.reinforce_window, "reinforce_window");
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("module") && j["module"].is_string())
        cfg.module = j["module"].get<std::string>();
    if (j.contains("name") && j["name"].is_string())
        cfg.name = j["name"].get<std::string>();

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        if (m.contains("stm_capacity") && m["stm_capacity"].is_number_unsigned())
            cfg.memory.stm_capacity = m["stm_capacity"].get<uint32_t>();
        if (m.contains("ltm_capacity") && m["ltm_capacity"].is_number_unsigned())
            cfg.memory.ltm_capacity = m["ltm_capacity"].get<uint32_t>();
        if (m.contains("promotion_threshold") && m["promotion_threshold"].is_number())
            cfg.memory.promotion_threshold = m["promotion_threshold"].get<double>();
        if (m.contains("default_importance") && m["default_importance"].is_number())
            cfg.memory.default_importance = m["default_importance"].get<double>();
        if (m.contains("similar_limit") && m["similar_limit"].is_number_unsigned())
            cfg.memory.similar_limit = m["similar_limit"].get<uint32_t>();
        if (m.contains("reinforce_factor") && m["reinforce_factor"].is_number())
            cfg.memory.reinforce_factor = m["reinforce_factor"].get<double>();
        if (m.contains("reinforce_window") && m["reinforce_window"].is_number_unsigned())
            cfg.memory.reinforce_window = m["reinforce_window"].get<uint32_t>();
    }

    sanitize(cfg.memory);
    return cfg;
}

Config Config::load() {
    Config cfg;

    std::string path = config_path();
    std::ifstream file(path);
    if (file.is_open()) {
        try {
            cfg = from_json(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << path
                      << ": " << e.what() << "\n";
            cfg = Config{};
        }
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("SUBSTRATE_STM_CAPACITY")) {
        if (auto n = parse_uint(v)) cfg.memory.stm_capacity = *n;
        else std::cerr << "[config] Ignoring SUBSTRATE_STM_CAPACITY=" << v << "\n";
    }
    if (const char* v = std::getenv("SUBSTRATE_LTM_CAPACITY")) {
        if (auto n = parse_uint(v)) cfg.memory.ltm_capacity = *n;
        else std::cerr << "[config] Ignoring SUBSTRATE_LTM_CAPACITY=" << v << "\n";
    }
    if (const char* v = std::getenv("SUBSTRATE_PROMOTION_THRESHOLD")) {
        if (auto d = parse_double(v)) cfg.memory.promotion_threshold = *d;
        else std::cerr << "[config] Ignoring SUBSTRATE_PROMOTION_THRESHOLD=" << v << "\n";
    }

    sanitize(cfg.memory);
    return cfg;
}

} // namespace substrate
