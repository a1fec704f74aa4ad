/**
 * @file Errors.hpp
 * @brief Error taxonomy shared by the configuration and cache operations.
 */

#pragma once
#include <string>

namespace wikiembed::domain {

/**
 * @enum ErrorKind
 * @brief Typed failure reasons returned to callers.
 */
enum class ErrorKind {
    None,
    ModelUnknown,
    IncompatibleDimension,
    NotAvailable,
    InstallationFailed,
    ConfigReadFailed,
    ConfigWriteFailed,
    CacheEntryNotFound,
    CacheWriteFailed,
    CacheParseSkipped,
    UnsupportedLanguage,
    Unauthorized
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::ModelUnknown: return "ModelUnknown";
        case ErrorKind::IncompatibleDimension: return "IncompatibleDimension";
        case ErrorKind::NotAvailable: return "NotAvailable";
        case ErrorKind::InstallationFailed: return "InstallationFailed";
        case ErrorKind::ConfigReadFailed: return "ConfigReadFailed";
        case ErrorKind::ConfigWriteFailed: return "ConfigWriteFailed";
        case ErrorKind::CacheEntryNotFound: return "CacheEntryNotFound";
        case ErrorKind::CacheWriteFailed: return "CacheWriteFailed";
        case ErrorKind::CacheParseSkipped: return "CacheParseSkipped";
        case ErrorKind::UnsupportedLanguage: return "UnsupportedLanguage";
        case ErrorKind::Unauthorized: return "Unauthorized";
    }
    return "Unknown";
}

/**
 * @struct OperationResult
 * @brief Outcome of an operation that has no payload.
 */
struct OperationResult {
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool ok() const { return error == ErrorKind::None; }

    static OperationResult Success() { return {}; }
    static OperationResult Failure(ErrorKind kind, const std::string& msg) {
        return OperationResult{kind, msg};
    }
};

} // namespace wikiembed::domain
