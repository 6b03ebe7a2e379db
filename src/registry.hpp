#pragma once
#include "module.hpp"
#include "config.hpp"
#include "status.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace substrate {

using ModuleFactory = std::function<std::unique_ptr<CognitiveModule>(const Config& config)>;

struct ModuleResult {
    std::unique_ptr<CognitiveModule> module;  // null unless status.ok()
    Status status;
};

// Central table of cognitive module factories. Holds factories only; every
// created module owns its own state.
// All methods are thread-safe.
class ModuleRegistry {
public:
    static ModuleRegistry& instance();

    // Duplicate names are rejected; the existing factory stays in place.
    Status register_module(const std::string& name, ModuleFactory factory);

    // Validates config.memory and looks up `name`. Nothing is created on error.
    ModuleResult create_module(const std::string& name, const Config& config) const;

    bool has_module(const std::string& name) const;
    std::vector<std::string> module_names() const;

    // Testing support. Returns true if the name was registered.
    bool unregister_module(const std::string& name);

private:
    ModuleRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ModuleFactory> factories_;
};

// Self-registrar helper (used at file scope in each module .cpp)
struct ModuleRegistrar {
    ModuleRegistrar(const std::string& name, ModuleFactory factory);
};

} // namespace substrate
