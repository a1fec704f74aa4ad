#include "application/CacheInvalidationAdvisor.hpp"
#include <sstream>
#include <utility>

namespace wikiembed::application {

CacheInvalidationAdvisor::CacheInvalidationAdvisor(std::filesystem::path databasesDir,
                                                   std::filesystem::path wikiCacheDir)
    : m_databasesDir(std::move(databasesDir)), m_wikiCacheDir(std::move(wikiCacheDir)) {}

std::optional<std::string> CacheInvalidationAdvisor::advise(const SwitchOutcome& outcome) const {
    if (outcome.state != SwitchState::Configured || !outcome.descriptor || outcome.descriptor->compatible) {
        return std::nullopt;
    }

    const auto& d = *outcome.descriptor;
    std::ostringstream ss;
    ss << "IMPORTANT: " << d.displayName << " produces " << d.dimensionality
       << "-dimensional vectors, but existing indexes were built with " << domain::kBaselineDimensions
       << ". Clear the embedding databases in " << m_databasesDir.string()
       << " (wikiembed clear-embeddings) and regenerate affected wikis cached in "
       << m_wikiCacheDir.string() << " (wikiembed cache delete ...) to prevent dimension mismatch errors.";
    return ss.str();
}

} // namespace wikiembed::application
