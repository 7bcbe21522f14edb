#include <cassert>
#include <iostream>

#include "TestSupport.hpp"

using namespace Debpack::CreateDebpack;
using namespace Debpack::CreateDebpack::Test;

// Lays out a project the way the tool expects it next to its executable.
static BuildPaths makeProject(const fs::path &root, const Settings &settings)
{
    writeFile(root / "Cargo.toml",
              "[package]\n"
              "name = \"Astra Lite\"\n"
              "version = \"2.0.1\"\n"
              "description = \"Telescope control\"\n");
    writeFile(root / "target" / "release" / "astra_lite", std::string(1500, 'x'));
    writeFile(root / "ui" / "astra_lite48x48.png", std::string(600, 'y'));
    return defaultBuildPaths(root, settings);
}

static void stubTools(FakeProcessRunner &runner, const std::string &arch)
{
    runner.reply("dpkg", 0, arch + "\n");
    runner.reply("dpkg-shlibdeps", 0, "shlibs:Depends=libc6 (>= 2.34)\n");
}

static void testSuccessfulBuild()
{
    TempDir dir("pipeline");
    Settings settings;
    BuildPaths paths = makeProject(dir.path(), settings);
    assert(paths.binary == dir.path() / "target" / "release" / "astra_lite");
    assert(paths.outputDir == dir.path() / "dist");

    std::string control;
    std::string desktop;
    FakeProcessRunner runner;
    stubTools(runner, "amd64");
    runner.on("dpkg-deb", [&](const Invocation &inv) {
        fs::path tree = inv.args.back();
        control = readFile(tree / "DEBIAN" / "control");
        desktop = readFile(tree / "usr" / "share" / "applications" / "astra_lite.desktop");
        assert(!fs::exists(tree / "debian"));
        return fakeDpkgDebBuild(inv);
    });

    BuildContext ctx = createPackage(paths, settings, runner);

    assert(ctx.artifact == dir.path() / "dist" / "astralite_2.0-1_amd64.deb");
    assert(fs::is_regular_file(ctx.artifact));
    assert(!fs::exists(dir.path() / "dist" / "astralite_2.0-1_amd64"));
    assert(ctx.architecture == "amd64");
    assert(ctx.dependencies == "libc6 (>= 2.34)");
    assert(ctx.installedSize == 2); // (1500 + 600) / 1024

    assert(control ==
        "Package: astralite\n"
        "Version: 2.0-1\n"
        "Architecture: amd64\n"
        "Maintainer: Denis Artemov (denis.artyomov@gmail.com)\n"
        "Depends: libc6 (>= 2.34)\n"
        "Installed-Size: 2\n"
        "Description: Telescope control\n");
    assert(desktop.find("Exec=/opt/astralite/astra_lite\n") != std::string::npos);
    assert(desktop.find("Comment=Telescope control\n") != std::string::npos);

    // Probe, scanner, builder, in that order.
    assert(runner.calls.size() == 3);
    assert(runner.calls[0].program == "dpkg");
    assert(runner.calls[1].program == "dpkg-shlibdeps");
    assert(runner.calls[2].program == "dpkg-deb");
}

static void testArchitectureOverride()
{
    TempDir dir("pipeline-arch");
    Settings settings;
    BuildPaths paths = makeProject(dir.path(), settings);

    FakeProcessRunner runner;
    runner.reply("dpkg-shlibdeps", 0, "shlibs:Depends=libc6\n");
    runner.on("dpkg-deb", fakeDpkgDebBuild);

    BuildContext ctx = createPackage(paths, settings, runner, "armhf");
    assert(ctx.artifact.filename() == "astralite_2.0-1_armhf.deb");
    for (const auto &call : runner.calls) {
        assert(call.program != "dpkg");
    }
}

static void testScannerFailureCleansUp()
{
    TempDir dir("pipeline-deps");
    Settings settings;
    BuildPaths paths = makeProject(dir.path(), settings);

    FakeProcessRunner runner;
    runner.reply("dpkg", 0, "amd64\n");
    runner.reply("dpkg-shlibdeps", 1, "");

    bool failed = false;
    try {
        createPackage(paths, settings, runner);
    } catch (const DependencyResolutionError &) {
        failed = true;
    }
    assert(failed);
    assert(!fs::exists(dir.path() / "dist" / "astralite_2.0-1_amd64"));

    // keep_failed_tree leaves it for inspection.
    settings.keepFailedTree = true;
    failed = false;
    try {
        createPackage(paths, settings, runner);
    } catch (const DependencyResolutionError &) {
        failed = true;
    }
    assert(failed);
    assert(fs::exists(dir.path() / "dist" / "astralite_2.0-1_amd64" / "opt" / "astralite"));
}

static void testBuilderFailureCleansUp()
{
    TempDir dir("pipeline-build");
    Settings settings;
    settings.keepFailedTree = true; // the assembler removes the tree regardless
    BuildPaths paths = makeProject(dir.path(), settings);

    FakeProcessRunner runner;
    stubTools(runner, "amd64");
    runner.reply("dpkg-deb", 2, "");

    bool failed = false;
    try {
        createPackage(paths, settings, runner);
    } catch (const BuildError &) {
        failed = true;
    }
    assert(failed);
    assert(!fs::exists(dir.path() / "dist" / "astralite_2.0-1_amd64"));
    assert(!fs::exists(dir.path() / "dist" / "astralite_2.0-1_amd64.deb"));
}

static void testEarlyFailures()
{
    TempDir dir("pipeline-early");
    Settings settings;
    BuildPaths paths = makeProject(dir.path(), settings);

    writeFile(paths.descriptor, "[package]\nname = \"x\"\nversion = \"v1\"\ndescription = \"d\"\n");
    FakeProcessRunner runner;
    stubTools(runner, "amd64");
    bool failed = false;
    try {
        createPackage(paths, settings, runner);
    } catch (const MetadataError &) {
        failed = true;
    }
    assert(failed);
    assert(runner.calls.empty());

    makeProject(dir.path(), settings);
    fs::remove(paths.binary);
    failed = false;
    try {
        createPackage(paths, settings, runner);
    } catch (const IOError &) {
        failed = true;
    }
    assert(failed);
    assert(!fs::exists(dir.path() / "dist" / "astralite_2.0-1_amd64"));
}

int main() {
    std::cout << "[Test] Starting Pipeline Test..." << std::endl;

    testSuccessfulBuild();
    testArchitectureOverride();
    testScannerFailureCleansUp();
    testBuilderFailureCleansUp();
    testEarlyFailures();

    std::cout << "[Test] Pipeline Test passed." << std::endl;
    return 0;
}
