/**
 * @file SwitchOutcome.hpp
 * @brief States and result of an embedding model switch.
 */

#pragma once

#include "domain/EmbeddingModel.hpp"
#include "domain/Errors.hpp"
#include <optional>
#include <string>

namespace wikiembed::application {

/**
 * @enum SwitchState
 * @brief Idle -> Validating -> {Rejected | Installing -> InstallFailed | Configuring -> Configured | ConfigureFailed}.
 */
enum class SwitchState {
    Idle,
    Validating,
    Rejected,
    Installing,
    InstallFailed,
    Configuring,
    Configured,
    ConfigureFailed
};

inline std::string SwitchStateToString(SwitchState state) {
    switch (state) {
        case SwitchState::Idle: return "Idle";
        case SwitchState::Validating: return "Validating";
        case SwitchState::Rejected: return "Rejected";
        case SwitchState::Installing: return "Installing";
        case SwitchState::InstallFailed: return "InstallFailed";
        case SwitchState::Configuring: return "Configuring";
        case SwitchState::Configured: return "Configured";
        case SwitchState::ConfigureFailed: return "ConfigureFailed";
    }
    return "Unknown";
}

/**
 * @struct SwitchOutcome
 * @brief Terminal state reached by ModelSwitcher::switchTo plus what happened.
 */
struct SwitchOutcome {
    SwitchState state = SwitchState::Idle;
    domain::ErrorKind error = domain::ErrorKind::None;
    std::string message;
    std::optional<domain::EmbeddingModelDescriptor> descriptor;
    std::string previousModel;             ///< Model active before the switch ("unknown" if none).
    bool configChanged = false;            ///< False when the target was already active.
    std::optional<std::string> advisory;   ///< Cache invalidation guidance, if any.

    bool ok() const { return state == SwitchState::Configured; }
};

} // namespace wikiembed::application
