#include "create-debpack.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace Debpack {
namespace CreateDebpack {

namespace fs = std::filesystem;

static const std::string kShlibsPrefix = "shlibs:Depends=";

std::string parseShlibdepsOutput(const std::string &output)
{
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind(kShlibsPrefix, 0) != 0) {
            continue;
        }
        std::string deps = line.substr(kShlibsPrefix.size());
        deps.erase(deps.find_last_not_of(" \t\n\r") + 1);
        return deps;
    }
    throw DependencyResolutionError("dpkg-shlibdeps output has no '" + kShlibsPrefix
                                    + "' line; unsupported dpkg-shlibdeps version?");
}

/**
 * @brief Writes the minimal debian/control dpkg-shlibdeps insists on finding
 *        in its working directory.
 */
static void writeScratchControl(const fs::path &scratchDir,
                                const ProjectMetadata &metadata,
                                const std::string &architecture)
{
    std::error_code ec;
    fs::create_directories(scratchDir, ec);
    if (ec) {
        throw IOError("Failed to create directory " + scratchDir.string() + ": " + ec.message());
    }

    fs::path controlFile = scratchDir / "control";
    std::ofstream out(controlFile);
    if (!out.is_open()) {
        throw IOError("Failed to write " + controlFile.string());
    }
    out << "Source: "       << metadata.packageName    << "\n"
        << "Version: "      << metadata.packageVersion << "\n"
        << "Architecture: " << architecture            << "\n";
    out.close();
    if (!out) {
        throw IOError("Failed to write " + controlFile.string());
    }
}

static void removeScratch(const fs::path &scratchDir)
{
    std::error_code ec;
    fs::remove_all(scratchDir, ec);
    if (ec) {
        log_warning("Failed to remove " + scratchDir.string() + ": " + ec.message());
    }
}

std::string resolveDependencies(ProcessRunner &runner,
                                const PackageTree &tree,
                                const ProjectMetadata &metadata,
                                const std::string &architecture)
{
    // Lives beside DEBIAN/ and opt/, never inside the install prefix.
    fs::path scratchDir = tree.root / "debian";
    writeScratchControl(scratchDir, metadata, architecture);

    // dpkg-shlibdeps wants the binary relative to the source package root.
    const std::string program = "dpkg-shlibdeps";
    const std::vector<std::string> args = {
        "-O",
        tree.installedBinary().substr(1)
    };

    log_message("Running: " + formatCommand(program, args) + " (in " + tree.root.string() + ")");
    ProcessResult res = runner.run(program, args, tree.root);
    removeScratch(scratchDir);

    if (res.exitCode != 0) {
        throw DependencyResolutionError("'" + formatCommand(program, args)
                                        + "' failed with exit code "
                                        + std::to_string(res.exitCode));
    }

    std::string deps = parseShlibdepsOutput(res.output);
    log_message("Dependencies: " + deps);
    return deps;
}

} // namespace CreateDebpack
} // namespace Debpack
