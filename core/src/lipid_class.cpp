#include "gslgen/lipid_class.hpp"
#include "gslgen/errors.hpp"

namespace gslgen {

const ClassRegistry& ClassRegistry::standard() {
    static const ClassRegistry registry = [] {
        ClassRegistry r;
        registerStandardClasses(r);
        return r;
    }();
    return registry;
}

void ClassRegistry::add(LipidClassDef def) {
    if (def.name.empty()) {
        throw ConfigurationError("lipid class name must not be empty");
    }
    if (classes_.count(def.name) != 0) {
        throw ConfigurationError("lipid class '" + def.name + "' is already registered");
    }
    std::string key = def.name;
    classes_.emplace(std::move(key), std::move(def));
}

const LipidClassDef& ClassRegistry::get(const std::string& name) const {
    auto it = classes_.find(name);
    if (it == classes_.end()) {
        throw ConfigurationError("unknown lipid class '" + name + "'");
    }
    return it->second;
}

bool ClassRegistry::contains(const std::string& name) const {
    return classes_.count(name) != 0;
}

std::vector<std::string> ClassRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(classes_.size());
    for (const auto& [name, def] : classes_) {
        out.push_back(name);
    }
    return out;
}

} // namespace gslgen
