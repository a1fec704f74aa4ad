/**
 * @file ModelInstaller.hpp
 * @brief Runs a model's install directive through the process runner.
 */

#pragma once

#include "domain/EmbeddingModel.hpp"
#include "domain/Errors.hpp"
#include "domain/ProcessRunner.hpp"
#include <string>
#include <vector>

namespace wikiembed::application {

class ModelInstaller {
public:
    explicit ModelInstaller(domain::ProcessRunner& runner);

    /**
     * @brief Executes the install directive once, synchronously, without retry.
     *
     * A model without a directive (API based) needs no installation and
     * succeeds immediately.
     * @return InstallationFailed if the command is missing, times out or exits non-zero.
     */
    domain::OperationResult install(const domain::EmbeddingModelDescriptor& descriptor);

    /** @brief Splits a directive on whitespace into argv. */
    static std::vector<std::string> SplitDirective(const std::string& directive);

private:
    domain::ProcessRunner& m_runner;
};

} // namespace wikiembed::application
