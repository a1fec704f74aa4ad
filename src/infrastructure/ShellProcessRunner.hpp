/**
 * @file ShellProcessRunner.hpp
 * @brief ProcessRunner backed by popen with a coreutils `timeout` bound.
 */

#pragma once
#include "domain/ProcessRunner.hpp"
#include <string>
#include <vector>

namespace wikiembed::infrastructure {

/**
 * @class ShellProcessRunner
 * @brief Runs commands through /bin/sh with every argument single-quoted.
 *
 * Each command is wrapped in `timeout <seconds>`; exit status 124 is reported
 * as a timeout and 127 as a command that could not be started.
 */
class ShellProcessRunner : public domain::ProcessRunner {
public:
    explicit ShellProcessRunner(int timeoutSeconds = 120);

    domain::ProcessResult run(const std::vector<std::string>& argv) override;

    /** @brief Quotes one argument for /bin/sh. */
    static std::string QuoteArgument(const std::string& arg);

private:
    int m_timeoutSeconds;
};

} // namespace wikiembed::infrastructure
