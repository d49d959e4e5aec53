#ifndef MCPDISPATCH_PROVIDER_DESCRIPTOR_HPP
#define MCPDISPATCH_PROVIDER_DESCRIPTOR_HPP

// One row per discoverable tool provider. Built fresh on every registry load
// and never mutated afterwards.

#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace provider_registry {

using json = nlohmann::json;
using EnvironmentMap = std::map<std::string, std::string>;

struct ProviderDescriptor {
    std::string name;        // unique key within one load
    std::string category;
    std::string description;
    std::string path;        // absolute entry point, never contains ".."
    EnvironmentMap env;      // injected at spawn time, may be empty
};

// {name, category, description, path, env}
json descriptor_to_json(const ProviderDescriptor &descriptor);

// True when path is absolute and has no "." or ".." segment.
bool is_safe_provider_path(const std::string &path);

} // namespace provider_registry

#endif // MCPDISPATCH_PROVIDER_DESCRIPTOR_HPP
