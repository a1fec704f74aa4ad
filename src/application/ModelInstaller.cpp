#include "application/ModelInstaller.hpp"
#include <iostream>
#include <sstream>

namespace wikiembed::application {

using domain::ErrorKind;
using domain::OperationResult;

ModelInstaller::ModelInstaller(domain::ProcessRunner& runner)
    : m_runner(runner) {}

std::vector<std::string> ModelInstaller::SplitDirective(const std::string& directive) {
    std::vector<std::string> argv;
    std::istringstream ss(directive);
    std::string token;
    while (ss >> token) {
        argv.push_back(token);
    }
    return argv;
}

OperationResult ModelInstaller::install(const domain::EmbeddingModelDescriptor& descriptor) {
    if (!descriptor.installDirective) {
        std::cout << "[ModelInstaller] Model " << descriptor.id << " is API-based and doesn't require installation" << std::endl;
        return OperationResult::Success();
    }

    auto argv = SplitDirective(*descriptor.installDirective);
    if (argv.empty()) {
        return OperationResult::Failure(ErrorKind::InstallationFailed,
                                        "Empty install command for " + descriptor.displayName);
    }

    std::cout << "[ModelInstaller] Installing " << descriptor.displayName << " using: " << *descriptor.installDirective << std::endl;
    auto result = m_runner.run(argv);

    if (!result.started) {
        std::string message = "Command not found for installing " + descriptor.displayName;
        std::cerr << "[ModelInstaller] " << message << std::endl;
        return OperationResult::Failure(ErrorKind::InstallationFailed, message);
    }
    if (result.timedOut) {
        std::string message = "Installation of " + descriptor.displayName + " timed out";
        std::cerr << "[ModelInstaller] " << message << std::endl;
        return OperationResult::Failure(ErrorKind::InstallationFailed, message);
    }
    if (result.exitCode != 0) {
        std::string message = "Failed to install " + descriptor.displayName + " (exit code "
                            + std::to_string(result.exitCode) + ")";
        std::cerr << "[ModelInstaller] " << message << std::endl;
        if (!result.output.empty()) {
            std::cerr << "[ModelInstaller] Error output: " << result.output << std::endl;
        }
        return OperationResult::Failure(ErrorKind::InstallationFailed, message);
    }

    std::cout << "[ModelInstaller] Successfully installed " << descriptor.displayName << std::endl;
    return OperationResult::Success();
}

} // namespace wikiembed::application
