#include <cassert>
#include <iostream>

#include "TestSupport.hpp"

using namespace Debpack::CreateDebpack;
using namespace Debpack::CreateDebpack::Test;

static std::string chomp(std::string s)
{
    s.erase(s.find_last_not_of("\n") + 1);
    return s;
}

static void testRunner()
{
    TempDir dir("runner");
    SystemProcessRunner runner;

    // Quotes and spaces reach the program unchanged.
    ProcessResult quoted = runner.run("printf", {"a'b"}, dir.path());
    assert(quoted.exitCode == 0);
    assert(quoted.output == "a'b");

    ProcessResult words = runner.run("printf", {"%s|", "a b", "$HOME", "c;d"}, fs::path());
    assert(words.exitCode == 0);
    assert(words.output == "a b|$HOME|c;d|");

    // Working directory
    ProcessResult pwd = runner.run("pwd", {}, dir.path());
    assert(pwd.exitCode == 0);
    assert(fs::canonical(chomp(pwd.output)) == fs::canonical(dir.path()));

    fs::path spaced = dir.path() / "with space";
    fs::create_directories(spaced);
    ProcessResult pwdSpaced = runner.run("pwd", {}, spaced);
    assert(pwdSpaced.exitCode == 0);
    assert(fs::canonical(chomp(pwdSpaced.output)) == fs::canonical(spaced));

    // Exit status decoding
    assert(runner.run("false", {}, fs::path()).exitCode == 1);
    assert(runner.run("true", {}, fs::path()).exitCode == 0);
    assert(runner.run("sh", {"-c", "exit 3"}, fs::path()).exitCode == 3);
    assert(runner.run("debpack-no-such-program", {}, fs::path()).exitCode == 127);

    // Unreachable working directory fails instead of running elsewhere.
    assert(runner.run("true", {}, dir.path() / "missing").exitCode != 0);
}

static void testMimeDetection()
{
    TempDir dir("mime");

    fs::path elf = dir.path() / "sh-copy";
    fs::copy_file("/bin/sh", elf);
    std::string elfType = detectMimeType(elf);
    assert(elfType == "application/x-executable" ||
           elfType == "application/x-pie-executable" ||
           elfType == "application/x-sharedlib");

    // Signature plus IHDR chunk of a 48x48 RGBA image.
    const char pngBytes[] =
        "\x89PNG\r\n\x1a\n"
        "\x00\x00\x00\x0d" "IHDR"
        "\x00\x00\x00\x30" "\x00\x00\x00\x30"
        "\x08\x06\x00\x00\x00"
        "\x57\x02\xf9\x87";
    fs::path png = dir.path() / "icon.png";
    writeFile(png, std::string(pngBytes, sizeof(pngBytes) - 1));
    assert(detectMimeType(png) == "image/png");

    fs::path text = dir.path() / "notes.txt";
    writeFile(text, "just some text\n");
    assert(detectMimeType(text).rfind("text/", 0) == 0);
}

int main() {
    std::cout << "[Test] Starting System Process Runner Test..." << std::endl;

    testRunner();
    std::cout << "[Test] Process runner OK." << std::endl;
    testMimeDetection();
    std::cout << "[Test] MIME detection OK." << std::endl;

    std::cout << "[Test] System Process Runner Test passed." << std::endl;
    return 0;
}
