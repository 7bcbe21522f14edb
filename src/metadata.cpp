#include "create-debpack.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <string>

/**
 * @brief Trims leading and trailing whitespace from the given string.
 *
 * Whitespace includes spaces, tabs, newlines, and carriage returns.
 * If the string is all whitespace, returns an empty string.
 */
static inline std::string trim(const std::string &s)
{
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    if (start == s.size()) {
        return "";
    }
    size_t end = s.size() - 1;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end]))) {
        --end;
    }
    return s.substr(start, end - start + 1);
}

/**
 * @brief Removes every double quote from a value, e.g. "\"0.0.12\"" -> "0.0.12".
 */
static std::string removeQuotes(const std::string &value)
{
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        if (c != '"') {
            result += c;
        }
    }
    return result;
}

namespace Debpack {
namespace CreateDebpack {

namespace fs = std::filesystem;

std::string normalizePackageName(const std::string &rawName)
{
    std::string name;
    for (char c : rawName) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '"' || c == '_' || std::isspace(uc)) {
            continue;
        }
        name += static_cast<char>(std::tolower(uc));
    }
    return name;
}

std::string normalizePackageVersion(const std::string &rawVersion)
{
    static const std::regex re_version("(\\d+)\\.(\\d+)\\.(\\d+)");

    std::smatch match;
    if (!std::regex_match(rawVersion, match, re_version)) {
        throw MetadataError("Version '" + rawVersion
                            + "' is not of the form MAJOR.MINOR.PATCH");
    }
    // The patch number becomes the Debian revision.
    return match[1].str() + "." + match[2].str() + "-" + match[3].str();
}

//------------------------------------------------------------------------------
// parseProjectDescriptor
//------------------------------------------------------------------------------
// Reads a Cargo.toml-like file line by line. Only "key = value" lines inside
// the [package] section are collected; other tables ([dependencies],
// [[bin]], ...) and comments are skipped.
ProjectMetadata parseProjectDescriptor(std::istream &in, const std::string &sourceName)
{
    std::regex re_section("^\\[+\\s*(.*?)\\s*\\]+$");
    std::regex re_key_value("^([A-Za-z0-9_.-]+)\\s*=\\s*(.*)$");

    bool sawPackage = false;
    bool inPackage  = false;
    bool haveName = false, haveVersion = false, haveDescription = false;

    ProjectMetadata metadata;

    std::string line;
    std::smatch match;

    while (std::getline(in, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        if (std::regex_match(trimmed, match, re_section)) {
            inPackage = (match[1].str() == "package");
            sawPackage = sawPackage || inPackage;
            continue;
        }

        if (!inPackage || !std::regex_match(trimmed, match, re_key_value)) {
            continue;
        }

        std::string key   = match[1].str();
        std::string value = trim(removeQuotes(match[2].str()));

        if (key == "name") {
            metadata.rawName = value;
            haveName = true;
        } else if (key == "version") {
            metadata.rawVersion = value;
            haveVersion = true;
        } else if (key == "description") {
            metadata.description = value;
            haveDescription = true;
        }
    }

    if (!sawPackage) {
        throw MetadataError("No [package] section in " + sourceName);
    }
    if (!haveName) {
        throw MetadataError("Missing 'name' in [package] section of " + sourceName);
    }
    if (!haveVersion) {
        throw MetadataError("Missing 'version' in [package] section of " + sourceName);
    }
    if (!haveDescription) {
        throw MetadataError("Missing 'description' in [package] section of " + sourceName);
    }

    metadata.packageName    = normalizePackageName(metadata.rawName);
    metadata.packageVersion = normalizePackageVersion(metadata.rawVersion);

    if (metadata.packageName.empty()) {
        throw MetadataError("Package name '" + metadata.rawName + "' in " + sourceName
                            + " is empty after normalization");
    }
    return metadata;
}

ProjectMetadata loadProjectMetadata(const fs::path &descriptorPath)
{
    std::ifstream file(descriptorPath);
    if (!file) {
        throw IOError("Error opening project descriptor: " + descriptorPath.string());
    }

    ProjectMetadata metadata = parseProjectDescriptor(file, descriptorPath.string());
    log_message("Package " + metadata.packageName + " " + metadata.packageVersion
                + " (from " + metadata.rawName + " " + metadata.rawVersion + ")");
    return metadata;
}

} // namespace CreateDebpack
} // namespace Debpack
