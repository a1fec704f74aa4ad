#include "application/ModelAvailabilityChecker.hpp"
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <type_traits>
#include <utility>
#include <variant>

namespace wikiembed::application {

ModelAvailabilityChecker::ModelAvailabilityChecker(domain::ProcessRunner& runner, std::string pythonExecutable)
    : m_runner(runner), m_pythonExecutable(std::move(pythonExecutable)) {}

bool ModelAvailabilityChecker::checkAvailable(const domain::EmbeddingModelDescriptor& descriptor) const {
    try {
        return std::visit([this](auto&& payload) -> bool {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, domain::OllamaModel>) {
                return checkOllama(payload);
            } else if constexpr (std::is_same_v<T, domain::HuggingFaceModel>) {
                return checkHuggingFace(payload);
            } else if constexpr (std::is_same_v<T, domain::OpenAIModel>) {
                return HasCredential(payload.credentialEnv);
            } else if constexpr (std::is_same_v<T, domain::GoogleModel>) {
                return HasCredential(payload.credentialEnv);
            } else {
                static_assert(sizeof(T) == 0, "unhandled provider payload");
            }
        }, descriptor.payload);
    } catch (const std::exception& e) {
        std::cerr << "[ModelAvailabilityChecker] Probe for " << descriptor.id << " failed: " << e.what() << std::endl;
    }
    return false;
}

domain::OperationResult ModelAvailabilityChecker::ensureAvailable(const domain::EmbeddingModelDescriptor& descriptor) const {
    if (checkAvailable(descriptor)) {
        return domain::OperationResult::Success();
    }

    std::string hint;
    if (const auto* openai = std::get_if<domain::OpenAIModel>(&descriptor.payload)) {
        hint = "set " + openai->credentialEnv;
    } else if (const auto* google = std::get_if<domain::GoogleModel>(&descriptor.payload)) {
        hint = "set " + google->credentialEnv;
    } else if (descriptor.installDirective) {
        hint = "run '" + *descriptor.installDirective + "'";
    }
    std::string message = "Model " + descriptor.id + " is not available";
    if (!hint.empty()) {
        message += " (" + hint + ")";
    }
    return domain::OperationResult::Failure(domain::ErrorKind::NotAvailable, message);
}

bool ModelAvailabilityChecker::checkOllama(const domain::OllamaModel& model) const {
    auto result = m_runner.run({"ollama", "list"});
    if (!result.started) {
        std::cerr << "[ModelAvailabilityChecker] Ollama not found. Please install Ollama first." << std::endl;
        return false;
    }
    if (!result.succeeded()) {
        std::cerr << "[ModelAvailabilityChecker] `ollama list` exited with code " << result.exitCode << std::endl;
        return false;
    }
    return ListsOllamaModel(result.output, model.tag);
}

bool ModelAvailabilityChecker::ListsOllamaModel(const std::string& listing, const std::string& tag) {
    std::istringstream lines(listing);
    std::string line;
    bool header = true;
    while (std::getline(lines, line)) {
        std::istringstream columns(line);
        std::string name;
        if (!(columns >> name)) continue;
        if (header) {
            header = false;
            if (name == "NAME") continue;
        }
        if (name == tag || name == tag + ":latest") {
            return true;
        }
    }
    return false;
}

bool ModelAvailabilityChecker::checkHuggingFace(const domain::HuggingFaceModel& model) const {
    auto result = m_runner.run({m_pythonExecutable, "-c", "import " + model.pythonModule});
    return result.succeeded();
}

bool ModelAvailabilityChecker::HasCredential(const std::string& envName) {
    const char* value = std::getenv(envName.c_str());
    return value != nullptr && value[0] != '\0';
}

} // namespace wikiembed::application
