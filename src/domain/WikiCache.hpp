/**
 * @file WikiCache.hpp
 * @brief Domain entities for cached wiki artifacts.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wikiembed::domain {

/**
 * @struct WikiPage
 * @brief One generated documentation page.
 */
struct WikiPage {
    std::string id;
    std::string title;
    std::string content;
    std::vector<std::string> filePaths;
    std::string importance; ///< "high", "medium" or "low".
    std::vector<std::string> relatedPages;

    bool operator==(const WikiPage& o) const {
        return id == o.id && title == o.title && content == o.content && filePaths == o.filePaths
            && importance == o.importance && relatedPages == o.relatedPages;
    }
};

struct WikiSection {
    std::string id;
    std::string title;
    std::vector<std::string> pages;
    std::optional<std::vector<std::string>> subsections;

    bool operator==(const WikiSection& o) const {
        return id == o.id && title == o.title && pages == o.pages && subsections == o.subsections;
    }
};

/**
 * @struct WikiStructure
 * @brief Page/section tree of a generated wiki.
 */
struct WikiStructure {
    std::string id;
    std::string title;
    std::string description;
    std::vector<WikiPage> pages;
    std::optional<std::vector<WikiSection>> sections;
    std::optional<std::vector<std::string>> rootSections;

    bool operator==(const WikiStructure& o) const {
        return id == o.id && title == o.title && description == o.description && pages == o.pages
            && sections == o.sections && rootSections == o.rootSections;
    }
};

/**
 * @struct RepoInfo
 * @brief Source repository descriptor attached to a cached wiki.
 */
struct RepoInfo {
    std::string owner;
    std::string repo;
    std::string type;
    std::optional<std::string> token;
    std::optional<std::string> localPath;
    std::optional<std::string> repoUrl;

    bool operator==(const RepoInfo& o) const {
        return owner == o.owner && repo == o.repo && type == o.type && token == o.token
            && localPath == o.localPath && repoUrl == o.repoUrl;
    }
};

/**
 * @struct WikiCacheEntry
 * @brief Everything stored for one (repository, language) pair.
 *
 * Keys of generatedPages are expected to match page ids in wikiStructure;
 * this is not enforced.
 */
struct WikiCacheEntry {
    WikiStructure wikiStructure;
    std::map<std::string, WikiPage> generatedPages;
    std::optional<std::string> repoUrl; ///< Older caches carry only the URL.
    std::optional<RepoInfo> repo;
    std::optional<std::string> provider;
    std::optional<std::string> model;

    bool operator==(const WikiCacheEntry& o) const {
        return wikiStructure == o.wikiStructure && generatedPages == o.generatedPages && repoUrl == o.repoUrl
            && repo == o.repo && provider == o.provider && model == o.model;
    }
    bool operator!=(const WikiCacheEntry& o) const { return !(*this == o); }
};

/**
 * @struct WikiCacheKey
 * @brief Composite address of one cached wiki.
 *
 * repoType, owner and language never contain the '_' separator; repo may.
 * The legacy filename encoding depends on this to be reversible.
 */
struct WikiCacheKey {
    std::string owner;
    std::string repo;
    std::string repoType;
    std::string language;

    /** @brief True if the key can be encoded into a file name and parsed back. */
    bool isValid() const;

    bool operator==(const WikiCacheKey& o) const {
        return owner == o.owner && repo == o.repo && repoType == o.repoType && language == o.language;
    }
};

/**
 * @struct ProcessedProject
 * @brief Listing entry recovered from a cache file name.
 */
struct ProcessedProject {
    std::string id;          ///< File name.
    WikiCacheKey key;
    std::string name;        ///< "owner/repo".
    long long submittedAtMs = 0; ///< File modification time.
};

} // namespace wikiembed::domain
