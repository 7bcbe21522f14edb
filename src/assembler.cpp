#include "create-debpack.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <string>
#include <system_error>
#include <vector>

namespace Debpack {
namespace CreateDebpack {

namespace fs = std::filesystem;

void verifyDebArchive(const fs::path &debFile)
{
    struct archive *a = archive_read_new();
    archive_read_support_format_ar(a);

    if (archive_read_open_filename(a, debFile.c_str(), 10240) != ARCHIVE_OK) {
        std::string reason = archive_error_string(a) ? archive_error_string(a) : "unknown error";
        archive_read_free(a);
        throw BuildError("Failed to open package " + debFile.string() + " => " + reason);
    }

    std::vector<std::string> members;
    struct archive_entry *entry;
    int r;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        const char *name = archive_entry_pathname(entry);
        if (name) {
            members.push_back(name);
        }
        archive_read_data_skip(a);
    }
    if (r != ARCHIVE_EOF) {
        std::string reason = archive_error_string(a) ? archive_error_string(a) : "unknown error";
        archive_read_free(a);
        throw BuildError("Corrupt package " + debFile.string() + " => " + reason);
    }
    archive_read_close(a);
    archive_read_free(a);

    // debian-binary must come first; dpkg refuses anything else.
    if (members.empty() || members.front() != "debian-binary") {
        throw BuildError(debFile.string() + " does not start with a debian-binary member");
    }
    bool haveControl = false, haveData = false;
    for (const auto &m : members) {
        haveControl = haveControl || m.rfind("control.tar", 0) == 0;
        haveData    = haveData    || m.rfind("data.tar", 0) == 0;
    }
    if (!haveControl) {
        throw BuildError(debFile.string() + " has no control.tar member");
    }
    if (!haveData) {
        throw BuildError(debFile.string() + " has no data.tar member");
    }
    log_message("Verified " + debFile.string() + " (" + std::to_string(members.size())
                + " members)");
}

bool removePackageTree(const fs::path &treeRoot)
{
    std::error_code ec;
    if (!fs::exists(treeRoot, ec)) {
        return true;
    }
    fs::remove_all(treeRoot, ec);
    if (ec) {
        log_warning("Failed to remove package tree " + treeRoot.string() + ": " + ec.message());
        return false;
    }
    log_message("Removed directory: " + treeRoot.string());
    return true;
}

fs::path assemblePackage(ProcessRunner &runner,
                         const PackageTree &tree,
                         const fs::path &outputDir)
{
    const std::string program = "dpkg-deb";
    const std::vector<std::string> args = {
        "--root-owner-group",
        "--build",
        tree.root.string()
    };
    // dpkg-deb --build <dir> writes <dir>.deb beside the tree, i.e. into outputDir.
    fs::path debFile = outputDir / (tree.packageFile + ".deb");

    log_message("Running: " + formatCommand(program, args));
    try {
        ProcessResult res = runner.run(program, args, fs::path());
        if (res.exitCode != 0) {
            throw BuildError("'" + formatCommand(program, args) + "' failed with exit code "
                             + std::to_string(res.exitCode));
        }
        std::error_code ec;
        if (!fs::is_regular_file(debFile, ec)) {
            throw BuildError("dpkg-deb succeeded but " + debFile.string() + " was not created");
        }
        verifyDebArchive(debFile);
    } catch (...) {
        removePackageTree(tree.root);
        throw;
    }

    removePackageTree(tree.root);
    log_message("Successfully created package: " + debFile.string());
    return debFile;
}

} // namespace CreateDebpack
} // namespace Debpack
