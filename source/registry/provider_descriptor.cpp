#include "registry/provider_descriptor.hpp"

#include <sstream>

namespace provider_registry {

json descriptor_to_json(const ProviderDescriptor &descriptor) {
    json entry;
    entry["name"] = descriptor.name;
    entry["category"] = descriptor.category;
    entry["description"] = descriptor.description;
    entry["path"] = descriptor.path;
    entry["env"] = json::object();
    for (const auto &variable : descriptor.env) {
        entry["env"][variable.first] = variable.second;
    }
    return entry;
}

bool is_safe_provider_path(const std::string &path) {
    if (path.empty() || path[0] != '/') {
        return false;
    }
    std::istringstream segment_stream(path);
    std::string segment;
    while (std::getline(segment_stream, segment, '/')) {
        if (segment == ".." || segment == ".") {
            return false;
        }
    }
    return true;
}

} // namespace provider_registry
