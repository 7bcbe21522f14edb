#include "create-debpack.hpp"

#include <string>
#include <system_error>

namespace Debpack {
namespace CreateDebpack {

namespace fs = std::filesystem;

namespace {

/**
 * Removes the package tree when the pipeline unwinds before the assembler
 * has taken care of it. keep = true leaves a failed tree for inspection.
 */
class TreeGuard {
public:
    TreeGuard(const fs::path &root, bool keep) : root_(root), keep_(keep) {}
    ~TreeGuard()
    {
        if (done_) {
            return;
        }
        if (keep_) {
            log_warning("Keeping package tree of the failed build: " + root_.string());
            return;
        }
        removePackageTree(root_);
    }
    void release() { done_ = true; }

private:
    fs::path root_;
    bool keep_;
    bool done_ = false;
};

} // namespace

BuildPaths defaultBuildPaths(const fs::path &projectRoot, const Settings &settings)
{
    BuildPaths paths;
    paths.descriptor = projectRoot / settings.descriptor;
    paths.binary     = projectRoot / settings.binaryDir / settings.binaryName;
    paths.icon       = projectRoot / settings.iconDir / settings.iconName;
    paths.outputDir  = projectRoot / settings.outputDir;
    return paths;
}

//------------------------------------------------------------------------------
// createPackage
//------------------------------------------------------------------------------
// 1) metadata + architecture
// 2) package tree
// 3) desktop entry, shared library dependencies
// 4) DEBIAN/control, DEBIAN/dirs
// 5) dpkg-deb (removes the tree)
BuildContext createPackage(const BuildPaths &paths,
                           const Settings &settings,
                           ProcessRunner &runner,
                           const std::string &architecture)
{
    BuildContext ctx;

    ctx.metadata = loadProjectMetadata(paths.descriptor);
    if (architecture.empty()) {
        ctx.architecture = probeArchitecture(runner);
    } else {
        ctx.architecture = architecture;
        log_message("Using architecture " + ctx.architecture + " from the command line.");
    }

    std::error_code ec;
    fs::create_directories(paths.outputDir, ec);
    if (ec) {
        throw IOError("Failed to create output directory " + paths.outputDir.string()
                      + ": " + ec.message());
    }

    // The guard covers a partially built tree as well.
    TreeGuard guard(paths.outputDir / packageFileName(ctx.metadata.packageName,
                                                      ctx.metadata.packageVersion,
                                                      ctx.architecture),
                    settings.keepFailedTree);

    ctx.tree = buildPackageTree(ctx.metadata, ctx.architecture,
                                paths.binary, paths.icon, paths.outputDir);

    DesktopEntry entry = makeDesktopEntry(ctx.metadata, settings, ctx.tree);
    ctx.desktopFile = writeDesktopEntry(ctx.tree, entry);

    ctx.dependencies = resolveDependencies(runner, ctx.tree, ctx.metadata, ctx.architecture);

    ctx.installedSize = computeInstalledSize(ctx.tree.installPrefix);

    ControlFields fields;
    fields.package       = ctx.metadata.packageName;
    fields.version       = ctx.metadata.packageVersion;
    fields.architecture  = ctx.architecture;
    fields.maintainer    = settings.maintainer;
    fields.depends       = ctx.dependencies;
    fields.installedSize = ctx.installedSize;
    fields.description   = ctx.metadata.description;
    writeControlFiles(ctx.tree, fields);

    // The assembler cleans up on both outcomes.
    guard.release();
    ctx.artifact = assemblePackage(runner, ctx.tree, paths.outputDir);

    log_message("All steps complete. Final package: " + ctx.artifact.string());
    return ctx;
}

} // namespace CreateDebpack
} // namespace Debpack
