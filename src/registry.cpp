#include "registry.hpp"
#include <algorithm>
#include <iostream>

namespace substrate {

ModuleRegistry& ModuleRegistry::instance() {
    static ModuleRegistry registry;
    return registry;
}

Status ModuleRegistry::register_module(const std::string& name, ModuleFactory factory) {
    if (name.empty()) {
        return Status::invalid_configuration("module name must not be empty");
    }
    if (!factory) {
        return Status::invalid_configuration("module '" + name + "' has no factory");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (factories_.count(name)) {
        return Status::invalid_configuration("module '" + name + "' is already registered");
    }
    factories_.emplace(name, std::move(factory));
    return Status::success();
}

ModuleResult ModuleRegistry::create_module(const std::string& name,
                                            const Config& config) const {
    ModuleResult result;
    result.status = validate(config.memory);
    if (!result.status.ok()) return result;

    ModuleFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(name);
        if (it == factories_.end()) {
            result.status = Status::invalid_configuration("unknown module: " + name);
            return result;
        }
        factory = it->second;
    }
    result.module = factory(config);
    return result;
}

bool ModuleRegistry::has_module(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(name) > 0;
}

std::vector<std::string> ModuleRegistry::module_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, _] : factories_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool ModuleRegistry::unregister_module(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.erase(name) > 0;
}

ModuleRegistrar::ModuleRegistrar(const std::string& name, ModuleFactory factory) {
    Status st = ModuleRegistry::instance().register_module(name, std::move(factory));
    if (!st.ok()) {
        std::cerr << "[registry] " << st.message << "\n";
    }
}

} // namespace substrate
