#include "create-debpack.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace Debpack {
namespace CreateDebpack {

namespace fs = std::filesystem;

DesktopEntry makeDesktopEntry(const ProjectMetadata &metadata,
                              const Settings &settings,
                              const PackageTree &tree)
{
    DesktopEntry entry;
    entry.version    = metadata.packageVersion;
    entry.name       = settings.displayName;
    entry.comment    = metadata.description;
    entry.categories = settings.categories;
    entry.tryExec    = tree.installedBinary();
    entry.exec       = tree.installedBinary();
    entry.icon       = tree.installedIcon();
    return entry;
}

// Empty values are written as "Key=" rather than dropped.
std::string renderDesktopEntry(const DesktopEntry &entry)
{
    std::ostringstream out;
    out << "[Desktop Entry]\n"
        << "Version="    << entry.version    << "\n"
        << "Type=Application\n"
        << "Name="       << entry.name       << "\n"
        << "Comment="    << entry.comment    << "\n"
        << "Categories=" << entry.categories << "\n"
        << "TryExec="    << entry.tryExec    << "\n"
        << "Exec="       << entry.exec       << "\n"
        << "Icon="       << entry.icon       << "\n";
    return out.str();
}

fs::path writeDesktopEntry(const PackageTree &tree, const DesktopEntry &entry)
{
    fs::path desktopDir = tree.root / "usr" / "share" / "applications";
    std::error_code ec;
    fs::create_directories(desktopDir, ec);
    if (ec) {
        throw IOError("Failed to create directory " + desktopDir.string() + ": " + ec.message());
    }

    fs::path desktopFile = desktopDir / (tree.binaryName + ".desktop");
    std::ofstream out(desktopFile, std::ios::binary);
    if (!out.is_open()) {
        throw IOError("Failed to write desktop entry " + desktopFile.string());
    }
    std::string content = renderDesktopEntry(entry);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw IOError("Failed to write desktop entry " + desktopFile.string());
    }

    log_message("Wrote desktop entry " + desktopFile.string());
    return desktopFile;
}

} // namespace CreateDebpack
} // namespace Debpack
