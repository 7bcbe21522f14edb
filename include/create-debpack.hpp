#ifndef CREATE_DEBPACK_HPP
#define CREATE_DEBPACK_HPP

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ANSI Color Macros for Console Output
// ---------------------------------------------------------------------------
// These are used in the inline logging functions below.
#define COLOR_RESET "\033[0m"
#define COLOR_INFO  "\033[32m"
#define COLOR_WARN  "\033[33m"
#define COLOR_ERROR "\033[31m"

namespace Debpack {
namespace CreateDebpack {

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

/**
 * @brief Base class of every failure raised by the packaging pipeline.
 *
 * main() catches this type, logs what() and exits with a non-zero status.
 */
class DebpackError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed or incomplete project descriptor, or an empty control field.
class MetadataError : public DebpackError {
public:
    using DebpackError::DebpackError;
};

/// Malformed debpack.yaml.
class ConfigError : public DebpackError {
public:
    using DebpackError::DebpackError;
};

/// 'dpkg --print-architecture' could not be run or failed.
class ProbeError : public DebpackError {
public:
    using DebpackError::DebpackError;
};

/// 'dpkg-shlibdeps' failed or printed something we cannot parse.
class DependencyResolutionError : public DebpackError {
public:
    using DebpackError::DebpackError;
};

/// Directory creation, copy, read or write failure.
class IOError : public DebpackError {
public:
    using DebpackError::DebpackError;
};

/// 'dpkg-deb' failed or produced an unusable archive.
class BuildError : public DebpackError {
public:
    using DebpackError::DebpackError;
};

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

/**
 * @brief Packaging settings that do not come from the project descriptor.
 *
 * Defaults describe the AstraLite layout. Every field can be overridden from
 * debpack.yaml (see loadSettings()).
 */
struct Settings {
    std::string displayName = "AstraLite";
    std::string binaryName  = "astra_lite";
    std::string iconName    = "astra_lite48x48.png";
    std::string categories  = "Graphics;Astronomy";
    std::string maintainer  = "Denis Artemov (denis.artyomov@gmail.com)";

    // Relative paths are resolved against the project root.
    std::filesystem::path descriptor = "Cargo.toml";
    std::filesystem::path binaryDir  = "target/release";
    std::filesystem::path iconDir    = "ui";
    std::filesystem::path outputDir  = "dist";

    bool keepFailedTree = false;
};

/**
 * @brief Reads debpack.yaml with yaml-cpp.
 *
 * A missing file yields the defaults. Unknown keys are reported with
 * log_warning().
 *
 * @param configPath Path to the YAML file.
 * @return The merged settings.
 * @throws ConfigError if the file cannot be parsed, a value is not a scalar,
 *         or binary/icon/maintainer end up empty.
 */
Settings loadSettings(const std::filesystem::path &configPath);

// ---------------------------------------------------------------------------
// Metadata Extractor
// ---------------------------------------------------------------------------

/**
 * @brief Project metadata read from the [package] section of the descriptor.
 *
 * packageName and packageVersion are the normalized forms used for the
 * package tree, the control file and the artifact name.
 */
struct ProjectMetadata {
    std::string rawName;
    std::string rawVersion;
    std::string description;

    std::string packageName;
    std::string packageVersion;
};

/**
 * @brief Strips quotes, underscores and whitespace and lower-cases the rest.
 *
 * "astra_lite" => "astralite", "Astra Lite" => "astralite".
 */
std::string normalizePackageName(const std::string &rawName);

/**
 * @brief Turns "MAJOR.MINOR.PATCH" into "MAJOR.MINOR-PATCH".
 *
 * @throws MetadataError unless rawVersion fully matches \d+\.\d+\.\d+.
 */
std::string normalizePackageVersion(const std::string &rawVersion);

/**
 * @brief Parses a Cargo.toml-style descriptor from a stream.
 *
 * @param in         The descriptor text.
 * @param sourceName Used in error messages only.
 * @throws MetadataError if [package], name, version or description is missing,
 *         or if the version is malformed.
 */
ProjectMetadata parseProjectDescriptor(std::istream &in, const std::string &sourceName);

/**
 * @brief Opens the descriptor file and runs parseProjectDescriptor() on it.
 *
 * @throws IOError if the file cannot be opened.
 */
ProjectMetadata loadProjectMetadata(const std::filesystem::path &descriptorPath);

// ---------------------------------------------------------------------------
// External processes
// ---------------------------------------------------------------------------

/// Exit status and captured standard output of one external command.
struct ProcessResult {
    int exitCode = -1;
    std::string output;
};

/**
 * @brief Runs external tools on behalf of the pipeline.
 *
 * Every dpkg invocation goes through this interface so tests can substitute
 * scripted results.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @param program    Executable name, looked up in PATH.
     * @param args       Arguments, passed without shell interpretation.
     * @param workingDir Directory to run in; empty means the current one.
     * @return Exit status (127 if the program was not found) and stdout.
     */
    virtual ProcessResult run(const std::string &program,
                              const std::vector<std::string> &args,
                              const std::filesystem::path &workingDir) = 0;
};

/**
 * @brief ProcessRunner backed by /bin/sh through popen().
 *
 * Arguments are single-quoted; stderr is left attached to the terminal.
 */
class SystemProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const std::string &program,
                      const std::vector<std::string> &args,
                      const std::filesystem::path &workingDir) override;
};

/// Renders a command line for log messages.
std::string formatCommand(const std::string &program, const std::vector<std::string> &args);

// ---------------------------------------------------------------------------
// Platform Prober
// ---------------------------------------------------------------------------

/**
 * @brief Asks 'dpkg --print-architecture' for the target architecture.
 *
 * @throws ProbeError if dpkg is missing, fails, or prints nothing.
 */
std::string probeArchitecture(ProcessRunner &runner);

// ---------------------------------------------------------------------------
// Package Tree Builder
// ---------------------------------------------------------------------------

/**
 * @brief The scratch directory hierarchy handed to dpkg-deb.
 */
struct PackageTree {
    std::string packageFile;   // <name>_<version>_<arch>
    std::filesystem::path root;           // <output>/<packageFile>
    std::filesystem::path controlDir;     // <root>/DEBIAN
    std::filesystem::path installPrefix;  // <root>/opt/<name>
    std::string installPrefixPath; // "/opt/<name>", as seen on the target system
    std::string binaryName;
    std::string iconName;

    /// Absolute in-package path of the binary, e.g. "/opt/astralite/astra_lite".
    std::string installedBinary() const { return installPrefixPath + "/" + binaryName; }
    /// Absolute in-package path of the icon.
    std::string installedIcon() const { return installPrefixPath + "/" + iconName; }
};

/// "<name>_<version>_<arch>"
std::string packageFileName(const std::string &packageName,
                            const std::string &packageVersion,
                            const std::string &architecture);

/**
 * @brief Creates <output>/<name>_<version>_<arch>/{DEBIAN,opt/<name>} and
 *        copies the binary and the icon into the install prefix.
 *
 * A tree left behind by an earlier run is removed first. Permissions of the
 * copied files are preserved, so the binary stays executable.
 *
 * @throws IOError on a missing source file or any filesystem failure.
 */
PackageTree buildPackageTree(const ProjectMetadata &metadata,
                             const std::string &architecture,
                             const std::filesystem::path &binaryFile,
                             const std::filesystem::path &iconFile,
                             const std::filesystem::path &outputDir);

/**
 * @brief Returns the libmagic MIME type of a file, or an empty string if
 *        libmagic cannot classify it.
 */
std::string detectMimeType(const std::filesystem::path &file);

// ---------------------------------------------------------------------------
// Desktop Entry Generator
// ---------------------------------------------------------------------------

/// Fields of the freedesktop.org application entry. All are always written.
struct DesktopEntry {
    std::string version;
    std::string name;
    std::string comment;
    std::string categories;
    std::string tryExec;
    std::string exec;
    std::string icon;
};

DesktopEntry makeDesktopEntry(const ProjectMetadata &metadata,
                              const Settings &settings,
                              const PackageTree &tree);

std::string renderDesktopEntry(const DesktopEntry &entry);

/**
 * @brief Writes the entry to <tree>/usr/share/applications/<binary>.desktop.
 *
 * @return The path of the written file.
 * @throws IOError if the directory or the file cannot be written.
 */
std::filesystem::path writeDesktopEntry(const PackageTree &tree, const DesktopEntry &entry);

// ---------------------------------------------------------------------------
// Dependency Resolver
// ---------------------------------------------------------------------------

/**
 * @brief Extracts the dependency expression from dpkg-shlibdeps -O output.
 *
 * @throws DependencyResolutionError if no line starts with "shlibs:Depends=".
 */
std::string parseShlibdepsOutput(const std::string &output);

/**
 * @brief Runs dpkg-shlibdeps on the installed binary inside the tree.
 *
 * A scratch debian/control is created for the duration of the call and
 * removed afterwards, whether or not the scanner succeeds.
 *
 * @throws DependencyResolutionError if the scanner fails or its output has
 *         no dependency line.
 * @throws IOError if the scratch control file cannot be written.
 */
std::string resolveDependencies(ProcessRunner &runner,
                                const PackageTree &tree,
                                const ProjectMetadata &metadata,
                                const std::string &architecture);

// ---------------------------------------------------------------------------
// Control File Writer
// ---------------------------------------------------------------------------

/// Sum of the sizes of all regular files below dir, in KiB (truncated).
std::uintmax_t computeInstalledSize(const std::filesystem::path &dir);

struct ControlFields {
    std::string package;
    std::string version;
    std::string architecture;
    std::string maintainer;
    std::string depends;
    std::uintmax_t installedSize = 0;
    std::string description;
};

/**
 * @brief Renders DEBIAN/control in the fixed field order.
 *
 * @throws MetadataError if any text field is empty.
 */
std::string renderControlFile(const ControlFields &fields);

/**
 * @brief Writes DEBIAN/control and DEBIAN/dirs.
 *
 * @throws MetadataError if a field is empty, IOError on write failure.
 */
void writeControlFiles(const PackageTree &tree, const ControlFields &fields);

// ---------------------------------------------------------------------------
// Package Assembler
// ---------------------------------------------------------------------------

/**
 * @brief Checks that a file is an ar archive with debian-binary, control.tar*
 *        and data.tar* members, using libarchive.
 *
 * @throws BuildError if the archive cannot be read or a member is missing.
 */
void verifyDebArchive(const std::filesystem::path &debFile);

/**
 * @brief Removes a package tree, logging instead of throwing on failure.
 *
 * @return True if the tree no longer exists.
 */
bool removePackageTree(const std::filesystem::path &treeRoot);

/**
 * @brief Runs 'dpkg-deb --root-owner-group --build' on the tree and verifies
 *        the resulting <output>/<packageFile>.deb.
 *
 * The tree is removed afterwards on success and on failure.
 *
 * @return Path of the produced .deb.
 * @throws BuildError if dpkg-deb fails or the archive is malformed.
 */
std::filesystem::path assemblePackage(ProcessRunner &runner,
                         const PackageTree &tree,
                         const std::filesystem::path &outputDir);

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

/// Input locations of one build.
struct BuildPaths {
    std::filesystem::path descriptor;
    std::filesystem::path binary;
    std::filesystem::path icon;
    std::filesystem::path outputDir;
};

/**
 * @brief Resolves the settings' relative locations against projectRoot.
 */
BuildPaths defaultBuildPaths(const std::filesystem::path &projectRoot, const Settings &settings);

/// Everything the stages produce, accumulated in pipeline order.
struct BuildContext {
    ProjectMetadata metadata;
    std::string architecture;
    PackageTree tree;
    std::filesystem::path desktopFile;
    std::string dependencies;
    std::uintmax_t installedSize = 0;
    std::filesystem::path artifact;
};

/**
 * @brief The whole packaging pipeline.
 *
 * Runs the stages in order, threading one BuildContext through them. Once
 * the package tree exists it is removed on every exit path, unless
 * settings.keepFailedTree is set and the build failed.
 *
 * @param architecture Forced architecture; empty means probe with dpkg.
 * @return The completed context; context.artifact is the produced .deb.
 * @throws DebpackError (or a subclass) from the first failing stage.
 */
BuildContext createPackage(const BuildPaths &paths,
                           const Settings &settings,
                           ProcessRunner &runner,
                           const std::string &architecture = std::string());

// ---------------------------------------------------------------------------
// Inline Logging Functions
// ---------------------------------------------------------------------------

/**
 * @brief Logs an informational message in green color to stderr, prefixed with "[INFO]".
 *
 * @param message The message text to log.
 */
inline void log_message(const std::string &message)
{
    std::cerr << COLOR_INFO << "[INFO] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a warning message in yellow color to stderr, prefixed with "[WARN]".
 *
 * @param message The warning message text to log.
 */
inline void log_warning(const std::string &message)
{
    std::cerr << COLOR_WARN << "[WARN] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message in red color to stderr, prefixed with "[ERROR]".
 *
 * @param message The error message text to log.
 */
inline void log_error(const std::string &message)
{
    std::cerr << COLOR_ERROR << "[ERROR] " << COLOR_RESET << message << std::endl;
}

} // namespace CreateDebpack
} // namespace Debpack

#endif // CREATE_DEBPACK_HPP
