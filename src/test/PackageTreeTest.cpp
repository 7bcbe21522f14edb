#include <cassert>
#include <iostream>

#include "TestSupport.hpp"

using namespace Debpack::CreateDebpack;
using namespace Debpack::CreateDebpack::Test;

int main() {
    std::cout << "[Test] Starting Package Tree Builder Test..." << std::endl;

    TempDir dir("tree");
    fs::path binary = dir.path() / "input" / "astra_lite";
    fs::path icon   = dir.path() / "input" / "astra_lite48x48.png";
    std::string binaryBytes("\x7f" "ELF\x02\x01\x01\0binary", 14);
    writeFile(binary, binaryBytes);
    writeFile(icon, "\x89PNG\r\n\x1a\nicon");
    fs::permissions(binary, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);

    ProjectMetadata md;
    md.rawName = "astra_lite";
    md.rawVersion = "0.0.12";
    md.description = "Software for deepsky astrophotography";
    md.packageName = "astralite";
    md.packageVersion = "0.0-12";

    fs::path output = dir.path() / "dist";
    fs::create_directories(output);

    assert(packageFileName("astralite", "0.0-12", "amd64") == "astralite_0.0-12_amd64");

    PackageTree tree = buildPackageTree(md, "amd64", binary, icon, output);
    assert(tree.packageFile == "astralite_0.0-12_amd64");
    assert(tree.root == output / "astralite_0.0-12_amd64");
    assert(fs::is_directory(tree.controlDir));
    assert(tree.controlDir == tree.root / "DEBIAN");
    assert(tree.installPrefix == tree.root / "opt" / "astralite");
    assert(tree.installPrefixPath == "/opt/astralite");
    assert(tree.installedBinary() == "/opt/astralite/astra_lite");
    assert(tree.installedIcon() == "/opt/astralite/astra_lite48x48.png");

    // Byte-identical copies, executable bit kept.
    assert(readFile(tree.installPrefix / "astra_lite") == binaryBytes);
    assert(readFile(tree.installPrefix / "astra_lite48x48.png") == readFile(icon));
    fs::perms p = fs::status(tree.installPrefix / "astra_lite").permissions();
    assert((p & fs::perms::owner_exec) != fs::perms::none);

    // A leftover from an earlier run is replaced, not merged.
    writeFile(tree.installPrefix / "stale.txt", "old");
    PackageTree again = buildPackageTree(md, "amd64", binary, icon, output);
    assert(!fs::exists(again.installPrefix / "stale.txt"));
    assert(fs::exists(again.installPrefix / "astra_lite"));

    // Missing icon
    bool failed = false;
    try {
        buildPackageTree(md, "arm64", binary, dir.path() / "input" / "missing.png", output);
    } catch (const IOError &) {
        failed = true;
    }
    assert(failed && "Missing icon should raise IOError.");

    std::cout << "[Test] Package Tree Builder Test passed." << std::endl;
    return 0;
}
