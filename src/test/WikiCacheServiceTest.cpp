#include <cassert>
#include <filesystem>
#include <iostream>

#include "application/WikiCacheService.hpp"
#include "infrastructure/FileWikiCacheRepository.hpp"

using namespace wikiembed;
namespace fs = std::filesystem;

namespace {

application::WikiCacheRequest MakeRequest(const std::string& language) {
    application::WikiCacheRequest request;
    request.repo.owner = "AsyncFuncAI";
    request.repo.repo = "deepwiki-open";
    request.repo.type = "github";
    request.language = language;
    request.wikiStructure.id = "wiki";
    request.wikiStructure.title = "DeepWiki";
    request.wikiStructure.description = "Overview";

    domain::WikiPage page;
    page.id = "overview";
    page.title = "Overview";
    page.content = "Content";
    page.importance = "high";
    request.wikiStructure.pages = {page};
    request.generatedPages["overview"] = page;
    request.provider = "google";
    request.model = "gemini-2.5-flash";
    return request;
}

infrastructure::LanguageConfig Languages() {
    infrastructure::LanguageConfig languages;
    languages.supportedLanguages = {{"en", "English"}, {"ja", "Japanese"}};
    languages.defaultLanguage = "en";
    return languages;
}

} // namespace

int main() {
    std::cout << "[Test] Starting WikiCacheService Test..." << std::endl;

    fs::path testRoot = "test_root_wiki_service";
    fs::remove_all(testRoot);
    infrastructure::FileWikiCacheRepository repo(testRoot);

    // Auth disabled.
    {
        application::WikiCacheService service(repo, Languages(), infrastructure::AuthSettings{});
        assert(!service.authRequired());

        // Unsupported language falls back to the default on write...
        assert(service.store(MakeRequest("xx")).ok());
        domain::WikiCacheKey enKey{"AsyncFuncAI", "deepwiki-open", "github", "en"};
        assert(fs::exists(repo.pathFor(enKey)));

        // ...and on read.
        auto viaFallback = service.get("AsyncFuncAI", "deepwiki-open", "github", "xx");
        assert(viaFallback);
        assert(viaFallback->provider && *viaFallback->provider == "google");
        assert(viaFallback->repo && viaFallback->repo->owner == "AsyncFuncAI");
        assert(viaFallback->generatedPages.count("overview") == 1);

        assert(!service.get("AsyncFuncAI", "deepwiki-open", "github", "ja"));
        assert(service.store(MakeRequest("ja")).ok());
        assert(service.get("AsyncFuncAI", "deepwiki-open", "github", "ja"));
        assert(service.processedProjects().size() == 2);

        // Delete refuses unsupported languages instead of falling back.
        auto unsupported = service.remove("AsyncFuncAI", "deepwiki-open", "github", "xx", std::nullopt);
        assert(unsupported.error == domain::ErrorKind::UnsupportedLanguage);
        assert(fs::exists(repo.pathFor(enKey)));

        assert(service.remove("AsyncFuncAI", "deepwiki-open", "github", "ja", std::nullopt).ok());
        auto missing = service.remove("AsyncFuncAI", "deepwiki-open", "github", "ja", std::nullopt);
        assert(missing.error == domain::ErrorKind::CacheEntryNotFound);
        std::cout << "[PASS] Language normalisation." << std::endl;
    }

    // Auth enabled.
    {
        infrastructure::AuthSettings auth;
        auth.enabled = true;
        auth.code = "s3cret";
        application::WikiCacheService service(repo, Languages(), auth);
        assert(service.authRequired());
        assert(service.validateAuthCode("s3cret"));
        assert(!service.validateAuthCode("wrong"));

        auto noCode = service.remove("AsyncFuncAI", "deepwiki-open", "github", "en", std::nullopt);
        assert(noCode.error == domain::ErrorKind::Unauthorized);
        auto wrongCode = service.remove("AsyncFuncAI", "deepwiki-open", "github", "en", std::string("nope"));
        assert(wrongCode.error == domain::ErrorKind::Unauthorized);
        assert(service.get("AsyncFuncAI", "deepwiki-open", "github", "en"));

        assert(service.remove("AsyncFuncAI", "deepwiki-open", "github", "en", std::string("s3cret")).ok());
        assert(!service.get("AsyncFuncAI", "deepwiki-open", "github", "en"));
        assert(service.processedProjects().empty());
        std::cout << "[PASS] Authorization gate." << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[PASS] WikiCacheService Test." << std::endl;
    return 0;
}
