#include "registry/provider_discovery.hpp"
#include "platform/platform_abi.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace provider_registry {

namespace fs = std::filesystem;

namespace {

struct CategoryMapping {
    const char *category;
    std::vector<const char *> keywords;
};

// Order matters: "web" maps to api before automation.
const std::vector<CategoryMapping> &category_mappings() {
    static const std::vector<CategoryMapping> mappings = {
        {"database", {"database", "postgres", "sql", "db"}},
        {"google", {"google", "gmail", "calendar", "drive", "sheets"}},
        {"productivity", {"productivity", "todo", "task", "excel", "time", "tracker"}},
        {"api", {"api", "rest", "http", "web"}},
        {"automation", {"browser", "playwright", "web", "automation"}},
        {"files", {"file", "pdf", "document", "edit"}},
        {"finance", {"finance", "ynab", "budget"}},
        {"media", {"media", "youtube", "video"}},
        {"storage", {"storage", "dropbox", "cloud"}},
        {"auth", {"auth", "authentication", "login"}},
        {"monitoring", {"log", "event", "monitor"}},
    };
    return mappings;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
}

std::string string_member(const json &object, const char *key, const std::string &fallback) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return fallback;
}

// "main", else "bin" (string or first entry of an object), else index.js.
std::string manifest_entry_point(const json &manifest) {
    if (manifest.contains("main") && manifest["main"].is_string() &&
        !manifest["main"].get<std::string>().empty()) {
        return manifest["main"].get<std::string>();
    }
    if (manifest.contains("bin")) {
        const json &bin = manifest["bin"];
        if (bin.is_string()) {
            return bin.get<std::string>();
        }
        if (bin.is_object() && !bin.empty() && bin.begin().value().is_string()) {
            return bin.begin().value().get<std::string>();
        }
    }
    return "index.js";
}

} // namespace

const char *error_kind_name(RegistryErrorKind kind) {
    switch (kind) {
    case RegistryErrorKind::none:
        return "none";
    case RegistryErrorKind::file_not_found:
        return "file_not_found";
    case RegistryErrorKind::parse_error:
        return "parse_error";
    case RegistryErrorKind::read_error:
        return "read_error";
    }
    return "unknown";
}

std::string infer_category(const std::vector<std::string> &keywords, const std::string &package_name) {
    std::string combined;
    for (size_t index = 0; index < keywords.size(); ++index) {
        if (index > 0) {
            combined += " ";
        }
        combined += keywords[index];
    }
    combined = to_lower(combined + " " + package_name);

    for (const auto &mapping : category_mappings()) {
        for (const char *keyword : mapping.keywords) {
            if (combined.find(keyword) != std::string::npos) {
                return mapping.category;
            }
        }
    }
    return DEFAULT_CATEGORY;
}

RegistryFileResult parse_registry_document(const std::string &document_text) {
    RegistryFileResult result;

    json document;
    try {
        document = json::parse(document_text);
    } catch (const json::parse_error &error) {
        result.error_kind = RegistryErrorKind::parse_error;
        result.error_message = "Registry parse error: " + std::string(error.what());
        return result;
    }

    if (!document.is_object()) {
        result.error_kind = RegistryErrorKind::parse_error;
        result.error_message = "Registry parse error: top level is not an object";
        return result;
    }

    result.success = true;
    if (!document.contains("servers") || !document["servers"].is_object()) {
        return result;
    }

    for (const auto &server_entry : document["servers"].items()) {
        const json &server = server_entry.value();
        if (!server.is_object()) {
            debug_log::log("Registry entry '" + server_entry.key() + "' is not an object, skipped.");
            continue;
        }

        ProviderDescriptor descriptor;
        descriptor.name = string_member(server, "name", server_entry.key());
        descriptor.category = string_member(server, "category", DEFAULT_CATEGORY);
        descriptor.description = string_member(server, "description", "");
        descriptor.path = string_member(server, "path", "");

        if (!is_safe_provider_path(descriptor.path)) {
            debug_log::notice("Registry entry '" + descriptor.name + "' has an unusable path '" +
                              descriptor.path + "', skipped.");
            continue;
        }

        if (server.contains("env") && server["env"].is_object()) {
            for (const auto &variable : server["env"].items()) {
                if (variable.value().is_string()) {
                    descriptor.env[variable.key()] = variable.value().get<std::string>();
                } else if (!variable.value().is_null()) {
                    descriptor.env[variable.key()] = variable.value().dump();
                }
            }
        }

        result.providers.push_back(std::move(descriptor));
    }

    return result;
}

RegistryFileResult read_registry_file(const std::string &registry_path) {
    std::ifstream file_stream(registry_path);
    if (!file_stream.is_open()) {
        RegistryFileResult result;
        std::error_code error;
        if (errno == ENOENT || !fs::exists(registry_path, error)) {
            result.error_kind = RegistryErrorKind::file_not_found;
            result.error_message = "File not found: " + registry_path;
        } else {
            result.error_kind = RegistryErrorKind::read_error;
            result.error_message = "Could not read registry file: " + registry_path;
        }
        return result;
    }

    std::ostringstream contents;
    contents << file_stream.rdbuf();
    return parse_registry_document(contents.str());
}

std::optional<ProviderDescriptor> parse_provider_directory(const std::string &directory_path,
                                                           const std::string &directory_name) {
    std::string manifest_path = (fs::path(directory_path) / MANIFEST_FILE_NAME).string();
    std::string manifest_text;
    if (!platform::read_file_contents(manifest_path, manifest_text)) {
        debug_log::log("No readable manifest in " + directory_path + ", skipped.");
        return std::nullopt;
    }

    json manifest;
    if (!json_rpc::try_parse(manifest_text, manifest) || !manifest.is_object()) {
        debug_log::notice("Could not parse provider manifest " + manifest_path + ", skipped.");
        return std::nullopt;
    }

    std::vector<std::string> keywords;
    if (manifest.contains("keywords") && manifest["keywords"].is_array()) {
        for (const auto &keyword : manifest["keywords"]) {
            if (keyword.is_string()) {
                keywords.push_back(keyword.get<std::string>());
            }
        }
    }

    ProviderDescriptor descriptor;
    descriptor.name = directory_name;
    descriptor.category = infer_category(keywords, string_member(manifest, "name", directory_name));
    descriptor.description = string_member(manifest, "description", "");
    if (descriptor.description.empty()) {
        descriptor.description = "MCP server: " + directory_name;
    }

    std::error_code error;
    fs::path base_directory = fs::absolute(fs::path(directory_path), error);
    if (error) {
        return std::nullopt;
    }
    base_directory = base_directory.lexically_normal();
    fs::path entry_point = (base_directory / manifest_entry_point(manifest)).lexically_normal();
    descriptor.path = entry_point.string();

    fs::path relative = entry_point.lexically_relative(base_directory);
    bool contained = !relative.empty() && *relative.begin() != ".." && *relative.begin() != ".";
    if (!contained || !is_safe_provider_path(descriptor.path)) {
        debug_log::notice("Provider '" + directory_name + "' entry point escapes its directory, skipped.");
        return std::nullopt;
    }

    return descriptor;
}

std::vector<ProviderDescriptor> discover_providers(const std::string &servers_directory) {
    std::vector<ProviderDescriptor> providers;

    std::error_code error;
    fs::directory_iterator directory_iterator(servers_directory, error);
    if (error) {
        debug_log::log("Could not discover providers from " + servers_directory + ": " + error.message());
        return providers;
    }

    std::vector<fs::directory_entry> entries;
    while (directory_iterator != fs::directory_iterator()) {
        entries.push_back(*directory_iterator);
        directory_iterator.increment(error);
        if (error) {
            break;
        }
    }
    // directory_iterator order is unspecified; keep loads reproducible.
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry &left, const fs::directory_entry &right) {
                  return left.path().filename() < right.path().filename();
              });

    for (const auto &entry : entries) {
        std::string directory_name = entry.path().filename().string();
        if (directory_name.empty() || directory_name[0] == '.') {
            continue;
        }
        std::error_code status_error;
        if (!entry.is_directory(status_error)) {
            continue;
        }
        auto descriptor = parse_provider_directory(entry.path().string(), directory_name);
        if (descriptor) {
            providers.push_back(std::move(*descriptor));
        }
    }

    return providers;
}

} // namespace provider_registry
