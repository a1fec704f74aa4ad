#include "domain/WikiCache.hpp"

namespace wikiembed::domain {

namespace {

bool IsSafeToken(const std::string& value, bool allowSeparator) {
    if (value.empty()) return false;
    if (value == "." || value == "..") return false;
    for (char c : value) {
        if (c == '/' || c == '\\' || c == '\0') return false;
        if (!allowSeparator && c == '_') return false;
    }
    return true;
}

} // namespace

bool WikiCacheKey::isValid() const {
    return IsSafeToken(repoType, false)
        && IsSafeToken(owner, false)
        && IsSafeToken(repo, true)
        && IsSafeToken(language, false);
}

} // namespace wikiembed::domain
