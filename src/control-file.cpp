#include "create-debpack.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace Debpack {
namespace CreateDebpack {

namespace fs = std::filesystem;

std::uintmax_t computeInstalledSize(const fs::path &dir)
{
    std::uintmax_t totalBytes = 0;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code ec_stat;
        auto status = fs::symlink_status(it->path(), ec_stat);
        if (ec_stat || !fs::is_regular_file(status)) {
            continue;
        }
        std::uintmax_t size = fs::file_size(it->path(), ec_stat);
        if (ec_stat) {
            throw IOError("Could not get file size of " + it->path().string()
                          + ": " + ec_stat.message());
        }
        totalBytes += size;
    }
    if (ec) {
        throw IOError("Failed to scan " + dir.string() + ": " + ec.message());
    }
    return totalBytes / 1024;
}

static void requireField(const char *name, const std::string &value)
{
    if (value.empty()) {
        throw MetadataError(std::string("Control field '") + name + "' is empty");
    }
}

std::string renderControlFile(const ControlFields &fields)
{
    requireField("Package", fields.package);
    requireField("Version", fields.version);
    requireField("Architecture", fields.architecture);
    requireField("Maintainer", fields.maintainer);
    requireField("Depends", fields.depends);
    requireField("Description", fields.description);

    std::ostringstream out;
    out << "Package: "        << fields.package       << "\n"
        << "Version: "        << fields.version       << "\n"
        << "Architecture: "   << fields.architecture  << "\n"
        << "Maintainer: "     << fields.maintainer    << "\n"
        << "Depends: "        << fields.depends       << "\n"
        << "Installed-Size: " << fields.installedSize << "\n"
        << "Description: "    << fields.description   << "\n";
    return out.str();
}

static void writeTextFile(const fs::path &path, const std::string &content)
{
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        throw IOError("Failed to write " + path.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw IOError("Failed to write " + path.string());
    }
    log_message("Wrote " + path.string());
}

void writeControlFiles(const PackageTree &tree, const ControlFields &fields)
{
    std::string control = renderControlFile(fields);

    writeTextFile(tree.controlDir / "control", control);
    writeTextFile(tree.controlDir / "dirs", tree.installPrefixPath + "\n");
}

} // namespace CreateDebpack
} // namespace Debpack
