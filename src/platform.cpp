#include "create-debpack.hpp"

#include <string>

namespace Debpack {
namespace CreateDebpack {

namespace fs = std::filesystem;

std::string probeArchitecture(ProcessRunner &runner)
{
    const std::string program = "dpkg";
    const std::vector<std::string> args = {"--print-architecture"};

    log_message("Running: " + formatCommand(program, args));
    ProcessResult res = runner.run(program, args, fs::path());

    if (res.exitCode == 127) {
        throw ProbeError("'dpkg' not found; cannot detect the target architecture");
    }
    if (res.exitCode != 0) {
        throw ProbeError("'" + formatCommand(program, args) + "' failed with exit code "
                         + std::to_string(res.exitCode));
    }

    std::string arch = res.output;
    arch.erase(arch.find_last_not_of(" \t\n\r") + 1);
    if (arch.empty()) {
        throw ProbeError("'" + formatCommand(program, args) + "' printed no architecture");
    }

    log_message("Target architecture: " + arch);
    return arch;
}

} // namespace CreateDebpack
} // namespace Debpack
