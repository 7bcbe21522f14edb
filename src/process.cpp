#include "create-debpack.hpp"

#include <array>
#include <cstdio>
#include <sstream>
#include <string>
#include <sys/wait.h>

namespace Debpack {
namespace CreateDebpack {

namespace fs = std::filesystem;

/**
 * @brief Wraps a word in single quotes for /bin/sh, escaping embedded quotes.
 */
static std::string shellQuote(const std::string &word)
{
    std::string quoted = word;
    size_t pos = 0;
    while ((pos = quoted.find('\'', pos)) != std::string::npos) {
        quoted.replace(pos, 1, "'\\''");
        pos += 4;
    }
    return "'" + quoted + "'";
}

std::string formatCommand(const std::string &program, const std::vector<std::string> &args)
{
    std::ostringstream cmd;
    cmd << program;
    for (const auto &arg : args) {
        cmd << ' ' << arg;
    }
    return cmd.str();
}

ProcessResult SystemProcessRunner::run(const std::string &program,
                                       const std::vector<std::string> &args,
                                       const fs::path &workingDir)
{
    std::ostringstream cmd;
    if (!workingDir.empty()) {
        cmd << "cd " << shellQuote(workingDir.string()) << " && ";
    }
    cmd << shellQuote(program);
    for (const auto &arg : args) {
        cmd << ' ' << shellQuote(arg);
    }

    ProcessResult result;

    FILE *pipe = popen(cmd.str().c_str(), "r");
    if (!pipe) {
        log_error("popen() failed for: " + cmd.str());
        return result;
    }

    std::array<char, 4096> buffer;
    size_t n;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), n);
    }

    int status = pclose(pipe);
    if (status == -1) {
        log_error("pclose() failed for: " + cmd.str());
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace CreateDebpack
} // namespace Debpack
