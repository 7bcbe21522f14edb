#include "create-debpack.hpp"

#include <string>
#include <system_error>
#include <unistd.h>

using namespace Debpack::CreateDebpack;

namespace fs = std::filesystem;

/**
 * @brief Project root: the parent of the directory holding this executable.
 */
static fs::path executableProjectRoot()
{
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        throw IOError("Cannot locate the running executable: " + ec.message());
    }
    return self.parent_path().parent_path();
}

/**
 * @brief main - Entry point for create-debpack.
 *
 * Without arguments everything is derived from the executable's location:
 * <root>/Cargo.toml, <root>/target/release/<binary>, <root>/ui/<icon>, and
 * the package lands in <root>/dist.
 *
 * @return 0 on success, non-zero on error.
 */
int main(int argc, char* argv[])
{
    if (geteuid() == 0) {
        log_warning("Running create-debpack as root is not needed; "
                    "dpkg-deb assigns root ownership itself.");
    }

    std::string archOverride;    // --arch=amd64 for cross builds
    std::string binOverride;     // --bin=/path/to/binary
    std::string rootOverride;    // --root=/path/to/project
    std::string configOverride;  // --config=/path/to/debpack.yaml
    bool keepFailedTree = false;

    // Parse command-line flags
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--arch=", 0) == 0) {
            archOverride = arg.substr(7);
        } else if (arg.rfind("--bin=", 0) == 0) {
            binOverride = arg.substr(6);
        } else if (arg.rfind("--root=", 0) == 0) {
            rootOverride = arg.substr(7);
        } else if (arg.rfind("--config=", 0) == 0) {
            configOverride = arg.substr(9);
        } else if (arg == "--keep-failed-tree") {
            keepFailedTree = true;
        } else {
            log_warning("Ignoring unknown argument: " + arg);
        }
    }

    try {
        fs::path root = rootOverride.empty() ? executableProjectRoot()
                                             : fs::absolute(rootOverride);
        fs::path configPath = configOverride.empty() ? root / "debpack.yaml"
                                                     : fs::path(configOverride);

        Settings settings = loadSettings(configPath);
        if (keepFailedTree) {
            settings.keepFailedTree = true;
        }

        BuildPaths paths = defaultBuildPaths(root, settings);
        if (!binOverride.empty()) {
            paths.binary = fs::absolute(binOverride);
        }

        SystemProcessRunner runner;
        BuildContext ctx = createPackage(paths, settings, runner, archOverride);
        std::cout << ctx.artifact.string() << "\n";
    } catch (const DebpackError &e) {
        log_error(e.what());
        return 1;
    } catch (const fs::filesystem_error &e) {
        log_error(std::string("Filesystem error: ") + e.what());
        return 1;
    }

    return 0;
}
