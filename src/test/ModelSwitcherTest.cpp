#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "FakeProcessRunner.hpp"
#include "application/CacheInvalidationAdvisor.hpp"
#include "application/ModelAvailabilityChecker.hpp"
#include "application/ModelInstaller.hpp"
#include "application/ModelSwitcher.hpp"
#include "infrastructure/FileEmbeddingConfigStore.hpp"

using namespace wikiembed;
using wikiembed::test::FakeProcessRunner;
namespace fs = std::filesystem;

namespace {

std::string ReadFile(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void WriteFile(const fs::path& p, const std::string& content) {
    std::ofstream f(p, std::ios::binary);
    f << content;
}

const char* kInitialConfig =
    "{\n"
    "  \"embedder\": {\n"
    "    \"client_class\": \"OllamaClient\",\n"
    "    \"model_kwargs\": {\n"
    "      \"model\": \"nomic-embed-text\"\n"
    "    }\n"
    "  },\n"
    "  \"retriever\": {\n"
    "    \"top_k\": 20\n"
    "  }\n"
    "}\n";

struct Fixture {
    fs::path root;
    FakeProcessRunner runner;
    infrastructure::FileEmbeddingConfigStore store;
    application::ModelAvailabilityChecker checker;
    application::ModelInstaller installer;
    application::CacheInvalidationAdvisor advisor;
    application::ModelSwitcher switcher;

    explicit Fixture(const fs::path& testRoot)
        : root(testRoot),
          store(testRoot / "embedder.json"),
          checker(runner, "python3"),
          installer(runner),
          advisor(testRoot / "databases", testRoot / "wikicache"),
          switcher(store, checker, installer, advisor) {}
};

// `ollama list` reports nomic-embed-text as installed.
domain::ProcessResult OllamaHasNomic(const std::vector<std::string>& argv) {
    if (argv.size() == 2 && argv[0] == "ollama" && argv[1] == "list") {
        return FakeProcessRunner::Exited(0, "NAME                    ID    SIZE\nnomic-embed-text:latest abc   274 MB\n");
    }
    return FakeProcessRunner::Exited(0, "");
}

// Each scenario gets an empty directory so backups from earlier scenarios cannot leak in.
fs::path FreshDir(const fs::path& dir) {
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ModelSwitcher Test..." << std::endl;

    fs::path testRoot = "test_root_model_switcher";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    setenv("OPENAI_API_KEY", "sk-test", 1);
    unsetenv("GOOGLE_API_KEY");

    // Unknown model: rejected, nothing touched.
    {
        fs::path dir = FreshDir(testRoot / "unknown");
        fs::path configPath = dir / "embedder.json";
        Fixture fx(dir);
        WriteFile(configPath, kInitialConfig);
        auto outcome = fx.switcher.switchTo("ollama_does-not-exist");
        assert(!outcome.ok());
        assert(outcome.state == application::SwitchState::Rejected);
        assert(outcome.error == domain::ErrorKind::ModelUnknown);
        assert(!outcome.descriptor);
        assert(fx.runner.calls.empty());
        assert(ReadFile(configPath) == kInitialConfig);
        assert(!fs::exists(fx.store.backupPath()));
        std::cout << "[PASS] Unknown model rejected." << std::endl;
    }

    // Idempotent switch to the active compatible model leaves the file byte-identical.
    {
        fs::path dir = FreshDir(testRoot / "idempotent");
        fs::path configPath = dir / "embedder.json";
        Fixture fx(dir);
        fx.runner.setHandler(OllamaHasNomic);
        WriteFile(configPath, kInitialConfig);
        auto outcome = fx.switcher.switchTo("ollama_nomic-embed-text");
        assert(outcome.ok());
        assert(!outcome.configChanged);
        assert(!outcome.advisory);
        assert(outcome.previousModel == "nomic-embed-text");
        assert(ReadFile(configPath) == kInitialConfig);
        assert(!fs::exists(fx.store.backupPath()));
        assert(fx.switcher.lastState() == application::SwitchState::Configured);
        std::cout << "[PASS] Idempotent switch is a no-op." << std::endl;
    }

    // Incompatible model without force: IncompatibleDimension, config unchanged.
    {
        fs::path dir = FreshDir(testRoot / "incompatible");
        fs::path configPath = dir / "embedder.json";
        Fixture fx(dir);
        WriteFile(configPath, kInitialConfig);
        auto outcome = fx.switcher.switchTo("openai_text-embedding-3-large", false);
        assert(outcome.state == application::SwitchState::Rejected);
        assert(outcome.error == domain::ErrorKind::IncompatibleDimension);
        assert(outcome.message.find("ollama_nomic-embed-text") != std::string::npos);
        assert(outcome.message.find("openai_text-embedding-3-small") != std::string::npos);
        assert(ReadFile(configPath) == kInitialConfig);
        assert(!fs::exists(fx.store.backupPath()));
        std::cout << "[PASS] Incompatible switch rejected without force." << std::endl;
    }

    // Incompatible model with force: new shape written, backup holds the old file, advisory attached.
    {
        fs::path dir = FreshDir(testRoot / "forced");
        fs::path configPath = dir / "embedder.json";
        Fixture fx(dir);
        WriteFile(configPath, kInitialConfig);
        auto outcome = fx.switcher.switchTo("openai_text-embedding-3-large", true);
        assert(outcome.ok());
        assert(outcome.configChanged);
        assert(outcome.advisory);
        assert(outcome.advisory->find("3072") != std::string::npos);
        assert(ReadFile(fx.store.backupPath()) == kInitialConfig);

        auto current = fx.store.getCurrent();
        assert(current.ok() && current.document);
        const auto& embedder = current.document->embedder;
        assert(embedder.clientKind == "OpenAIClient");
        assert(embedder.model() == "text-embedding-3-large");
        assert(embedder.dimensions() && *embedder.dimensions() == 3072);
        assert(current.document->otherSections["retriever"]["top_k"] == 20);
        std::cout << "[PASS] Forced incompatible switch updates config." << std::endl;
    }

    // Cloud model without credential: nothing to install, the switch still goes through.
    {
        fs::path dir = FreshDir(testRoot / "no_credential");
        fs::path configPath = dir / "embedder.json";
        Fixture fx(dir);
        WriteFile(configPath, kInitialConfig);
        auto outcome = fx.switcher.switchTo("google_text-embedding-004");
        assert(outcome.ok());
        assert(outcome.configChanged);
        assert(!outcome.advisory);
        assert(fx.runner.calls.empty());
        assert(ReadFile(fx.store.backupPath()) == kInitialConfig);
        auto current = fx.store.getCurrent();
        assert(current.document->embedder.clientKind == "GoogleEmbedderClient");
        assert(current.document->embedder.modelParams["task_type"] == "SEMANTIC_SIMILARITY");
        assert(*current.document->embedder.dimensions() == 768);

        // Setting the credential afterwards does not change the configuration.
        setenv("GOOGLE_API_KEY", "g-test", 1);
        auto retry = fx.switcher.switchTo("google_text-embedding-004");
        assert(retry.ok());
        assert(!retry.configChanged);
        unsetenv("GOOGLE_API_KEY");
        std::cout << "[PASS] Cloud switch without credential is configured." << std::endl;
    }

    // Local library missing and install fails: InstallFailed, config untouched.
    {
        fs::path dir = FreshDir(testRoot / "install_failed");
        fs::path configPath = dir / "embedder.json";
        Fixture fx(dir);
        fx.runner.setHandler([](const std::vector<std::string>& argv) {
            if (argv[0] == "pip") return FakeProcessRunner::Exited(1, "ERROR: No matching distribution");
            return FakeProcessRunner::Exited(1, "ModuleNotFoundError: No module named 'sentence_transformers'");
        });
        WriteFile(configPath, kInitialConfig);
        auto outcome = fx.switcher.switchTo("huggingface_all-mpnet-base-v2");
        assert(outcome.state == application::SwitchState::InstallFailed);
        assert(outcome.error == domain::ErrorKind::InstallationFailed);
        assert(fx.runner.calls.size() == 2);
        assert(fx.runner.calls[0][0] == "python3");
        assert(fx.runner.calls[1] == (std::vector<std::string>{"pip", "install", "sentence-transformers"}));
        assert(ReadFile(configPath) == kInitialConfig);
        assert(!fs::exists(fx.store.backupPath()));
        std::cout << "[PASS] Failed install leaves config untouched." << std::endl;
    }

    // Local runtime model missing, install succeeds: configured.
    {
        fs::path dir = FreshDir(testRoot / "install_ok");
        fs::path configPath = dir / "embedder.json";
        Fixture fx(dir);
        fx.runner.setHandler([](const std::vector<std::string>& argv) {
            if (argv[0] == "ollama" && argv[1] == "list") return FakeProcessRunner::Exited(0, "NAME ID SIZE\n");
            return FakeProcessRunner::Exited(0, "pulling manifest\nsuccess\n");
        });
        fs::remove(configPath);
        auto outcome = fx.switcher.switchTo("ollama_nomic-embed-text");
        assert(outcome.ok());
        assert(outcome.previousModel == "nomic-embed-text");
        assert(fx.runner.calls.size() == 2);
        assert(fx.runner.calls[1] == (std::vector<std::string>{"ollama", "pull", "nomic-embed-text"}));
        // No prior file: the defaults are written and nothing is backed up.
        assert(fs::exists(configPath));
        assert(!fs::exists(fx.store.backupPath()));
        std::cout << "[PASS] Missing model installed before switch." << std::endl;
    }

    // Compatible cloud switch carries the dimensions parameter.
    {
        fs::path dir = FreshDir(testRoot / "cloud_compatible");
        fs::path configPath = dir / "embedder.json";
        Fixture fx(dir);
        WriteFile(configPath, kInitialConfig);
        auto outcome = fx.switcher.switchTo("openai_text-embedding-3-small");
        assert(outcome.ok());
        assert(!outcome.advisory);
        auto embedder = application::ModelSwitcher::BuildEmbedder(*outcome.descriptor);
        assert(embedder.clientKind == "OpenAIClient");
        assert(*embedder.dimensions() == 768);
        assert(fx.store.getCurrent().document->embedder == embedder);
        std::cout << "[PASS] Compatible cloud switch." << std::endl;
    }

    unsetenv("OPENAI_API_KEY");
    fs::remove_all(testRoot);
    std::cout << "[PASS] ModelSwitcher Test." << std::endl;
    return 0;
}
