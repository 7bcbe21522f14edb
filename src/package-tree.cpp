#include "create-debpack.hpp"

#include <cstring>
#include <magic.h>
#include <string>
#include <system_error>

namespace Debpack {
namespace CreateDebpack {

namespace fs = std::filesystem;

std::string packageFileName(const std::string &packageName,
                            const std::string &packageVersion,
                            const std::string &architecture)
{
    return packageName + "_" + packageVersion + "_" + architecture;
}

std::string detectMimeType(const fs::path &file)
{
    magic_t magic = magic_open(MAGIC_MIME_TYPE);
    if (!magic) {
        log_warning("Could not initialize libmagic");
        return "";
    }
    if (magic_load(magic, nullptr) != 0) {
        log_warning(std::string("Could not load the libmagic database: ") + magic_error(magic));
        magic_close(magic);
        return "";
    }

    const char *fileType = magic_file(magic, file.c_str());
    std::string mime = fileType ? fileType : "";

    magic_close(magic);
    return mime;
}

/**
 * @brief Warns when the inputs do not look like what they claim to be.
 */
static void sniffInputs(const fs::path &binaryFile, const fs::path &iconFile)
{
    std::string binaryType = detectMimeType(binaryFile);
    bool isElf = strstr(binaryType.c_str(), "x-executable")     ||
                 strstr(binaryType.c_str(), "x-pie-executable") ||
                 strstr(binaryType.c_str(), "x-sharedlib");
    if (!binaryType.empty() && !isElf) {
        log_warning(binaryFile.string() + " does not look like an ELF executable ("
                    + binaryType + ")");
    }

    std::string iconType = detectMimeType(iconFile);
    if (!iconType.empty() && iconType.rfind("image/", 0) != 0) {
        log_warning(iconFile.string() + " does not look like an image (" + iconType + ")");
    }
}

static void copyInto(const fs::path &source, const fs::path &destDir)
{
    if (!fs::is_regular_file(source)) {
        throw IOError("Source file does not exist: " + source.string());
    }

    fs::path dest = destDir / source.filename();
    std::error_code ec;
    fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw IOError("Failed to copy " + source.string() + " to " + dest.string()
                      + ": " + ec.message());
    }
    // copy_file keeps the mode bits, but be explicit for the executable.
    fs::permissions(dest, fs::status(source).permissions(), fs::perm_options::replace, ec);
    if (ec) {
        throw IOError("Failed to set permissions on " + dest.string() + ": " + ec.message());
    }
    log_message("Copied " + source.string() + " => " + dest.string());
}

static void makeDirectory(const fs::path &dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw IOError("Failed to create directory " + dir.string() + ": " + ec.message());
    }
}

PackageTree buildPackageTree(const ProjectMetadata &metadata,
                             const std::string &architecture,
                             const fs::path &binaryFile,
                             const fs::path &iconFile,
                             const fs::path &outputDir)
{
    PackageTree tree;
    tree.packageFile       = packageFileName(metadata.packageName, metadata.packageVersion,
                                             architecture);
    tree.root              = outputDir / tree.packageFile;
    tree.controlDir        = tree.root / "DEBIAN";
    tree.installPrefixPath = "/opt/" + metadata.packageName;
    tree.installPrefix     = tree.root / "opt" / metadata.packageName;
    tree.binaryName        = binaryFile.filename().string();
    tree.iconName          = iconFile.filename().string();

    std::error_code ec;
    if (fs::exists(tree.root, ec)) {
        log_warning("Removing stale package tree " + tree.root.string());
        fs::remove_all(tree.root, ec);
        if (ec) {
            throw IOError("Failed to remove stale package tree " + tree.root.string()
                          + ": " + ec.message());
        }
    }

    makeDirectory(tree.controlDir);
    makeDirectory(tree.installPrefix);

    sniffInputs(binaryFile, iconFile);
    copyInto(binaryFile, tree.installPrefix);
    copyInto(iconFile, tree.installPrefix);

    log_message("Package tree ready: " + tree.root.string());
    return tree;
}

} // namespace CreateDebpack
} // namespace Debpack
