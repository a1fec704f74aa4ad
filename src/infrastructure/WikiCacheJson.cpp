/**
 * @file WikiCacheJson.cpp
 * @brief Implementation of the wiki cache JSON mapping.
 */

#include "infrastructure/WikiCacheJson.hpp"

namespace wikiembed::domain {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadOptional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out = std::nullopt;
        return;
    }
    out = it->template get<T>();
}

template <typename T>
void WriteOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

} // namespace

void to_json(json& j, const WikiPage& page) {
    j = {
        {"id", page.id},
        {"title", page.title},
        {"content", page.content},
        {"filePaths", page.filePaths},
        {"importance", page.importance},
        {"relatedPages", page.relatedPages}
    };
}

void from_json(const json& j, WikiPage& page) {
    page.id = j.at("id").get<std::string>();
    page.title = j.at("title").get<std::string>();
    page.content = j.at("content").get<std::string>();
    page.filePaths = j.value("filePaths", std::vector<std::string>{});
    page.importance = j.value("importance", std::string("medium"));
    page.relatedPages = j.value("relatedPages", std::vector<std::string>{});
}

void to_json(json& j, const WikiSection& section) {
    j = {
        {"id", section.id},
        {"title", section.title},
        {"pages", section.pages}
    };
    WriteOptional(j, "subsections", section.subsections);
}

void from_json(const json& j, WikiSection& section) {
    section.id = j.at("id").get<std::string>();
    section.title = j.at("title").get<std::string>();
    section.pages = j.value("pages", std::vector<std::string>{});
    ReadOptional(j, "subsections", section.subsections);
}

void to_json(json& j, const WikiStructure& structure) {
    j = {
        {"id", structure.id},
        {"title", structure.title},
        {"description", structure.description},
        {"pages", structure.pages}
    };
    WriteOptional(j, "sections", structure.sections);
    WriteOptional(j, "rootSections", structure.rootSections);
}

void from_json(const json& j, WikiStructure& structure) {
    structure.id = j.at("id").get<std::string>();
    structure.title = j.at("title").get<std::string>();
    structure.description = j.value("description", std::string());
    structure.pages = j.at("pages").get<std::vector<WikiPage>>();
    ReadOptional(j, "sections", structure.sections);
    ReadOptional(j, "rootSections", structure.rootSections);
}

void to_json(json& j, const RepoInfo& repo) {
    j = {
        {"owner", repo.owner},
        {"repo", repo.repo},
        {"type", repo.type}
    };
    WriteOptional(j, "token", repo.token);
    WriteOptional(j, "localPath", repo.localPath);
    WriteOptional(j, "repoUrl", repo.repoUrl);
}

void from_json(const json& j, RepoInfo& repo) {
    repo.owner = j.at("owner").get<std::string>();
    repo.repo = j.at("repo").get<std::string>();
    repo.type = j.at("type").get<std::string>();
    ReadOptional(j, "token", repo.token);
    ReadOptional(j, "localPath", repo.localPath);
    ReadOptional(j, "repoUrl", repo.repoUrl);
}

void to_json(json& j, const WikiCacheEntry& entry) {
    j = {
        {"wiki_structure", entry.wikiStructure},
        {"generated_pages", entry.generatedPages}
    };
    WriteOptional(j, "repo_url", entry.repoUrl);
    WriteOptional(j, "repo", entry.repo);
    WriteOptional(j, "provider", entry.provider);
    WriteOptional(j, "model", entry.model);
}

void from_json(const json& j, WikiCacheEntry& entry) {
    entry.wikiStructure = j.at("wiki_structure").get<WikiStructure>();
    entry.generatedPages = j.at("generated_pages").get<std::map<std::string, WikiPage>>();
    ReadOptional(j, "repo_url", entry.repoUrl);
    ReadOptional(j, "repo", entry.repo);
    ReadOptional(j, "provider", entry.provider);
    ReadOptional(j, "model", entry.model);
}

} // namespace wikiembed::domain
