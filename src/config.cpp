#include "create-debpack.hpp"

#include <set>
#include <string>
#include <yaml-cpp/yaml.h>

namespace Debpack {
namespace CreateDebpack {

namespace fs = std::filesystem;

static std::string scalarValue(const YAML::Node &node, const std::string &key)
{
    if (!node.IsScalar()) {
        throw ConfigError("Configuration key '" + key + "' must be a scalar");
    }
    return node.as<std::string>();
}

Settings loadSettings(const fs::path &configPath)
{
    Settings settings;

    std::error_code ec;
    if (!fs::exists(configPath, ec)) {
        log_message("No configuration at " + configPath.string() + "; using defaults.");
        return settings;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(configPath.string());
    } catch (const YAML::Exception &ex) {
        throw ConfigError("Failed to parse " + configPath.string() + ": " + ex.what());
    }

    if (root.IsNull()) {
        return settings;
    }
    if (!root.IsMap()) {
        throw ConfigError(configPath.string() + " must contain a mapping");
    }

    static const std::set<std::string> knownKeys = {
        "display_name", "binary", "icon", "categories", "maintainer",
        "descriptor", "binary_dir", "icon_dir", "output_dir", "keep_failed_tree"
    };

    try {
        for (const auto &item : root) {
            std::string key = item.first.as<std::string>();
            if (knownKeys.count(key) == 0) {
                log_warning("Unknown configuration key '" + key + "' in " + configPath.string());
                continue;
            }
            const YAML::Node &value = item.second;

            if (key == "display_name") {
                settings.displayName = scalarValue(value, key);
            } else if (key == "binary") {
                settings.binaryName = scalarValue(value, key);
            } else if (key == "icon") {
                settings.iconName = scalarValue(value, key);
            } else if (key == "categories") {
                settings.categories = scalarValue(value, key);
            } else if (key == "maintainer") {
                settings.maintainer = scalarValue(value, key);
            } else if (key == "descriptor") {
                settings.descriptor = scalarValue(value, key);
            } else if (key == "binary_dir") {
                settings.binaryDir = scalarValue(value, key);
            } else if (key == "icon_dir") {
                settings.iconDir = scalarValue(value, key);
            } else if (key == "output_dir") {
                settings.outputDir = scalarValue(value, key);
            } else if (key == "keep_failed_tree") {
                if (!value.IsScalar()) {
                    throw ConfigError("Configuration key 'keep_failed_tree' must be a boolean");
                }
                settings.keepFailedTree = value.as<bool>();
            }
        }
    } catch (const YAML::Exception &ex) {
        throw ConfigError("Invalid value in " + configPath.string() + ": " + ex.what());
    }

    if (settings.binaryName.empty()) {
        throw ConfigError("Configuration key 'binary' must not be empty");
    }
    if (settings.iconName.empty()) {
        throw ConfigError("Configuration key 'icon' must not be empty");
    }
    if (settings.maintainer.empty()) {
        throw ConfigError("Configuration key 'maintainer' must not be empty");
    }

    log_message("Loaded configuration from " + configPath.string());
    return settings;
}

} // namespace CreateDebpack
} // namespace Debpack
