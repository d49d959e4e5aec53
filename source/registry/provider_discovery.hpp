#ifndef MCPDISPATCH_PROVIDER_DISCOVERY_HPP
#define MCPDISPATCH_PROVIDER_DISCOVERY_HPP

// Filesystem discovery of installed providers and parsing of the declarative
// registry file. Both produce descriptor lists; merging happens in Registry.

#include <optional>
#include <string>
#include <vector>

#include "registry/provider_descriptor.hpp"

namespace provider_registry {

// Category used when no keyword in the table matches.
static const char DEFAULT_CATEGORY[] = "utilities";

// Manifest file expected in every provider directory.
static const char MANIFEST_FILE_NAME[] = "package.json";

enum class RegistryErrorKind {
    none,
    file_not_found,
    parse_error,
    read_error
};

// Stable lowercase name for logs and error payloads.
const char *error_kind_name(RegistryErrorKind kind);

// Result of reading the declarative registry file.
struct RegistryFileResult {
    bool success = false;
    std::vector<ProviderDescriptor> providers;
    RegistryErrorKind error_kind = RegistryErrorKind::none;
    std::string error_message;
};

// Read {"servers": {key: {name, category, description, path, env?}}}.
// A missing "servers" member is an empty, successful result.
RegistryFileResult read_registry_file(const std::string &registry_path);

// Same as read_registry_file but from already-loaded text.
RegistryFileResult parse_registry_document(const std::string &document_text);

// Scan servers_directory; one descriptor per subdirectory with a usable
// manifest. A missing directory yields an empty list.
std::vector<ProviderDescriptor> discover_providers(const std::string &servers_directory);

// Build a descriptor from one provider directory, or nothing when the
// manifest is missing or malformed.
std::optional<ProviderDescriptor> parse_provider_directory(const std::string &directory_path,
                                                           const std::string &directory_name);

// Ordered keyword table lookup over keywords and package name; first match wins.
std::string infer_category(const std::vector<std::string> &keywords, const std::string &package_name);

} // namespace provider_registry

#endif // MCPDISPATCH_PROVIDER_DISCOVERY_HPP
