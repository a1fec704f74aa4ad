/**
 * @file ModelSwitcher.cpp
 * @brief Implementation of the ModelSwitcher state machine.
 */

#include "application/ModelSwitcher.hpp"
#include "domain/ModelCatalog.hpp"
#include <iostream>
#include <type_traits>
#include <variant>

namespace wikiembed::application {

using domain::ErrorKind;
using json = nlohmann::json;

ModelSwitcher::ModelSwitcher(domain::EmbeddingConfigStore& store,
                             ModelAvailabilityChecker& checker,
                             ModelInstaller& installer,
                             const CacheInvalidationAdvisor& advisor)
    : m_store(store), m_checker(checker), m_installer(installer), m_advisor(advisor) {}

void ModelSwitcher::transition(SwitchState next) {
    std::cout << "[ModelSwitcher] " << SwitchStateToString(m_state) << " -> " << SwitchStateToString(next) << std::endl;
    m_state = next;
}

SwitchOutcome ModelSwitcher::finish(SwitchOutcome outcome, SwitchState state, ErrorKind error, const std::string& message) {
    transition(state);
    outcome.state = state;
    outcome.error = error;
    outcome.message = message;
    if (error != ErrorKind::None) {
        std::cerr << "[ModelSwitcher] " << message << std::endl;
    } else {
        std::cout << "[ModelSwitcher] " << message << std::endl;
    }
    return outcome;
}

domain::EmbedderConfiguration ModelSwitcher::BuildEmbedder(const domain::EmbeddingModelDescriptor& descriptor) {
    domain::EmbedderConfiguration embedder;
    std::visit([&](auto&& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, domain::OllamaModel>) {
            embedder.clientKind = "OllamaClient";
            embedder.modelParams = {{"model", payload.tag}};
        } else if constexpr (std::is_same_v<T, domain::HuggingFaceModel>) {
            embedder.clientKind = "HuggingFaceClient";
            embedder.modelParams = {{"model", payload.modelName}};
        } else if constexpr (std::is_same_v<T, domain::OpenAIModel>) {
            embedder.clientKind = "OpenAIClient";
            embedder.modelParams = {{"model", payload.modelName}, {"dimensions", descriptor.dimensionality}};
        } else if constexpr (std::is_same_v<T, domain::GoogleModel>) {
            embedder.clientKind = "GoogleEmbedderClient";
            embedder.modelParams = {{"model", payload.modelName},
                                    {"dimensions", descriptor.dimensionality},
                                    {"task_type", payload.taskType}};
        } else {
            static_assert(sizeof(T) == 0, "unhandled provider payload");
        }
    }, descriptor.payload);
    return embedder;
}

SwitchOutcome ModelSwitcher::switchTo(const std::string& modelId, bool force) {
    m_state = SwitchState::Idle;
    SwitchOutcome outcome;
    transition(SwitchState::Validating);

    auto descriptor = domain::ModelCatalog::findById(modelId);
    if (!descriptor) {
        return finish(outcome, SwitchState::Rejected, ErrorKind::ModelUnknown, "Model " + modelId + " not found");
    }
    outcome.descriptor = descriptor;

    // Current configuration only feeds logging and the sibling sections we carry over.
    auto current = m_store.getCurrent();
    if (!current.ok()) {
        std::cerr << "[ModelSwitcher] Ignoring unreadable configuration: " << current.message << std::endl;
    }
    domain::EmbeddingConfigDocument currentDoc =
        current.document ? *current.document : domain::EmbeddingConfigDocument::Defaults();
    outcome.previousModel = currentDoc.embedder.model();

    std::cout << "[ModelSwitcher] Switching from " << outcome.previousModel << " to " << descriptor->displayName << std::endl;

    if (!descriptor->compatible && !force) {
        std::string message = "Model " + descriptor->displayName + " has " + std::to_string(descriptor->dimensionality)
                            + " dimensions and would break existing indexes built with "
                            + std::to_string(domain::kBaselineDimensions)
                            + ". Use --force to proceed anyway, or choose a compatible model:";
        for (const auto& id : domain::ModelCatalog::compatibleModelIds()) {
            message += " " + id;
        }
        return finish(outcome, SwitchState::Rejected, ErrorKind::IncompatibleDimension, message);
    }

    if (!m_checker.checkAvailable(*descriptor)) {
        // API models install nothing; the credential only has to be present when embeddings are requested.
        if (!descriptor->installDirective) {
            std::cerr << "[ModelSwitcher] Warning: " << descriptor->displayName
                      << " is not usable yet, its API credential is not set in this environment" << std::endl;
        }
        transition(SwitchState::Installing);
        std::cout << "[ModelSwitcher] Model " << descriptor->displayName << " is not available. Attempting to install..." << std::endl;
        auto installed = m_installer.install(*descriptor);
        if (!installed.ok()) {
            return finish(outcome, SwitchState::InstallFailed, ErrorKind::InstallationFailed, installed.message);
        }
    }

    transition(SwitchState::Configuring);
    domain::EmbeddingConfigDocument newDoc = currentDoc;
    newDoc.embedder = BuildEmbedder(*descriptor);

    if (current.document && newDoc == *current.document) {
        outcome = finish(outcome, SwitchState::Configured, ErrorKind::None,
                         descriptor->displayName + " is already the active embedding model");
    } else {
        auto written = m_store.updateCurrent(newDoc);
        if (!written.ok()) {
            return finish(outcome, SwitchState::ConfigureFailed, ErrorKind::ConfigWriteFailed, written.message);
        }
        outcome.configChanged = true;
        outcome = finish(outcome, SwitchState::Configured, ErrorKind::None,
                         "Successfully switched to " + descriptor->displayName);
    }

    outcome.advisory = m_advisor.advise(outcome);
    if (outcome.advisory) {
        std::cerr << "[ModelSwitcher] " << *outcome.advisory << std::endl;
    }
    return outcome;
}

} // namespace wikiembed::application
