#include "infrastructure/ShellProcessRunner.hpp"
#include <cstdio>
#include <iostream>
#include <sstream>
#include <sys/wait.h>

namespace wikiembed::infrastructure {

namespace {
constexpr int kTimeoutExitCode = 124;
constexpr int kNotFoundExitCode = 127;
}

ShellProcessRunner::ShellProcessRunner(int timeoutSeconds)
    : m_timeoutSeconds(timeoutSeconds > 0 ? timeoutSeconds : 120) {}

std::string ShellProcessRunner::QuoteArgument(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

domain::ProcessResult ShellProcessRunner::run(const std::vector<std::string>& argv) {
    domain::ProcessResult result;
    if (argv.empty()) {
        return result;
    }

    std::stringstream cmd;
    cmd << "timeout " << m_timeoutSeconds;
    for (const auto& arg : argv) {
        cmd << " " << QuoteArgument(arg);
    }
    cmd << " 2>&1";

    std::cout << "[ShellProcessRunner] Running: " << cmd.str() << std::endl;

    FILE* pipe = popen(cmd.str().c_str(), "r");
    if (!pipe) {
        std::cerr << "[ShellProcessRunner] popen failed to start command: " << argv.front() << std::endl;
        return result;
    }

    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output.append(buffer);
    }
    int status = pclose(pipe);

    if (status == -1) {
        std::cerr << "[ShellProcessRunner] Could not collect exit status of " << argv.front() << std::endl;
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    result.started = (result.exitCode != kNotFoundExitCode);
    result.timedOut = (result.exitCode == kTimeoutExitCode);
    if (result.timedOut) {
        std::cerr << "[ShellProcessRunner] Command timed out after " << m_timeoutSeconds << "s: " << argv.front() << std::endl;
    } else if (!result.started) {
        std::cerr << "[ShellProcessRunner] Command not found: " << argv.front() << std::endl;
    }
    return result;
}

} // namespace wikiembed::infrastructure
