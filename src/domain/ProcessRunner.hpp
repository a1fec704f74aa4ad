/**
 * @file ProcessRunner.hpp
 * @brief Capability for running external commands.
 */

#pragma once
#include <string>
#include <vector>

namespace wikiembed::domain {

/**
 * @struct ProcessResult
 * @brief Captured outcome of one external command.
 */
struct ProcessResult {
    bool started = false;  ///< False if the command could not be launched at all.
    int exitCode = -1;
    bool timedOut = false;
    std::string output;    ///< Combined stdout and stderr.

    bool succeeded() const { return started && !timedOut && exitCode == 0; }
};

/**
 * @class ProcessRunner
 * @brief Runs a command synchronously and reports its output.
 *
 * The call blocks for the whole lifetime of the child. Implementations used
 * in production bound that lifetime with a timeout.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /** @param argv Program followed by its arguments; never interpreted by a shell. */
    virtual ProcessResult run(const std::vector<std::string>& argv) = 0;
};

} // namespace wikiembed::domain
