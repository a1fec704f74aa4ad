/**
 * @file FileWikiCacheRepository.cpp
 * @brief Implementation of FileWikiCacheRepository.
 */

#include "infrastructure/FileWikiCacheRepository.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/WikiCacheJson.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace wikiembed::infrastructure {

using domain::ErrorKind;
using domain::OperationResult;

namespace {

std::string Describe(const domain::WikiCacheKey& key) {
    return key.owner + "/" + key.repo + " (" + key.repoType + "), lang: " + key.language;
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

long long ToEpochMillis(fs::file_time_type ftime) {
    auto systemTime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now()
    );
    return std::chrono::duration_cast<std::chrono::milliseconds>(systemTime.time_since_epoch()).count();
}

} // namespace

FileWikiCacheRepository::FileWikiCacheRepository(fs::path cacheDir)
    : m_cacheDir(std::move(cacheDir)) {}

fs::path FileWikiCacheRepository::pathFor(const domain::WikiCacheKey& key) const {
    std::string filename = std::string(kFilePrefix) + key.repoType + "_" + key.owner + "_" + key.repo + "_"
                         + key.language + kFileSuffix;
    return m_cacheDir / filename;
}

std::optional<domain::WikiCacheEntry> FileWikiCacheRepository::get(const domain::WikiCacheKey& key) const {
    if (!key.isValid()) {
        return std::nullopt;
    }

    fs::path cachePath = pathFor(key);
    std::error_code ec;
    if (!fs::exists(cachePath, ec)) {
        return std::nullopt;
    }

    try {
        std::ifstream f(cachePath);
        if (!f.is_open()) {
            std::cerr << "[FileWikiCacheRepository] Cannot open " << cachePath.string() << std::endl;
            return std::nullopt;
        }
        json j = json::parse(f);
        return j.get<domain::WikiCacheEntry>();
    } catch (const std::exception& e) {
        std::cerr << "[FileWikiCacheRepository] Error reading wiki cache from " << cachePath.string()
                  << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

OperationResult FileWikiCacheRepository::put(const domain::WikiCacheKey& key, const domain::WikiCacheEntry& entry) {
    if (!key.isValid()) {
        std::string message = "Invalid cache key: " + Describe(key)
                            + " (repo type, owner and language must be non-empty and free of '_' and path separators)";
        std::cerr << "[FileWikiCacheRepository] " << message << std::endl;
        return OperationResult::Failure(ErrorKind::CacheWriteFailed, message);
    }

    fs::path cachePath = pathFor(key);
    std::string payload;
    try {
        payload = json(entry).dump(2);
    } catch (const std::exception& e) {
        std::string message = std::string("Could not serialize wiki cache payload: ") + e.what();
        std::cerr << "[FileWikiCacheRepository] " << message << std::endl;
        return OperationResult::Failure(ErrorKind::CacheWriteFailed, message);
    }

    std::cout << "[FileWikiCacheRepository] Writing cache file to: " << cachePath.string()
              << " (" << payload.size() << " bytes)" << std::endl;

    std::string error;
    if (!AtomicFileWriter::Write(cachePath, payload, &error)) {
        return OperationResult::Failure(ErrorKind::CacheWriteFailed,
                                        "Failed to save wiki cache to " + cachePath.string() + ": " + error);
    }
    return OperationResult::Success();
}

OperationResult FileWikiCacheRepository::remove(const domain::WikiCacheKey& key) {
    if (!key.isValid()) {
        return OperationResult::Failure(ErrorKind::CacheEntryNotFound, "Wiki cache not found: " + Describe(key));
    }

    fs::path cachePath = pathFor(key);
    std::error_code ec;
    bool removed = fs::remove(cachePath, ec);
    if (ec) {
        std::string message = "Failed to delete wiki cache " + cachePath.string() + ": " + ec.message();
        std::cerr << "[FileWikiCacheRepository] " << message << std::endl;
        return OperationResult::Failure(ErrorKind::CacheWriteFailed, message);
    }
    if (!removed) {
        std::cerr << "[FileWikiCacheRepository] Wiki cache not found, cannot delete: " << cachePath.string() << std::endl;
        return OperationResult::Failure(ErrorKind::CacheEntryNotFound, "Wiki cache not found: " + Describe(key));
    }

    std::cout << "[FileWikiCacheRepository] Deleted wiki cache: " << cachePath.string() << std::endl;
    return OperationResult::Success();
}

std::optional<domain::WikiCacheKey> FileWikiCacheRepository::parseFilename(const std::string& filename) {
    const std::string prefix = kFilePrefix;
    const std::string suffix = kFileSuffix;
    if (filename.rfind(prefix, 0) != 0 || !EndsWith(filename, suffix)
        || filename.size() <= prefix.size() + suffix.size()) {
        return std::nullopt;
    }

    std::string body = filename.substr(prefix.size(), filename.size() - prefix.size() - suffix.size());
    std::vector<std::string> parts;
    std::stringstream ss(body);
    std::string token;
    while (std::getline(ss, token, '_')) {
        parts.push_back(token);
    }
    if (!body.empty() && body.back() == '_') {
        parts.push_back("");
    }

    if (parts.size() < 4) {
        return std::nullopt;
    }

    domain::WikiCacheKey key;
    key.repoType = parts.front();
    key.owner = parts[1];
    key.language = parts.back();
    for (size_t i = 2; i + 1 < parts.size(); ++i) {
        if (i > 2) key.repo += "_";
        key.repo += parts[i];
    }
    return key;
}

std::vector<domain::ProcessedProject> FileWikiCacheRepository::listAll() const {
    return scan(nullptr);
}

std::vector<domain::ProcessedProject> FileWikiCacheRepository::scan(std::vector<std::string>* skipped) const {
    std::vector<domain::ProcessedProject> projects;
    std::vector<std::pair<fs::file_time_type, domain::ProcessedProject>> found;

    std::error_code ec;
    if (!fs::exists(m_cacheDir, ec)) {
        std::cout << "[FileWikiCacheRepository] Cache directory " << m_cacheDir.string()
                  << " not found. Returning empty list." << std::endl;
        return projects;
    }

    for (fs::directory_iterator it(m_cacheDir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code fileEc;
        if (!entry.is_regular_file(fileEc)) continue;

        std::string filename = entry.path().filename().string();
        if (filename.rfind(kFilePrefix, 0) != 0 || !EndsWith(filename, kFileSuffix)) continue;

        auto key = parseFilename(filename);
        if (!key) {
            std::cerr << "[FileWikiCacheRepository] " << domain::ErrorKindToString(domain::ErrorKind::CacheParseSkipped)
                      << ": could not parse project details from filename " << filename << std::endl;
            if (skipped) skipped->push_back(filename);
            continue;
        }

        auto ftime = fs::last_write_time(entry.path(), fileEc);
        if (fileEc) {
            std::cerr << "[FileWikiCacheRepository] Error processing file " << entry.path().string()
                      << ": " << fileEc.message() << std::endl;
            continue;
        }

        domain::ProcessedProject project;
        project.id = filename;
        project.key = *key;
        project.name = key->owner + "/" + key->repo;
        project.submittedAtMs = ToEpochMillis(ftime);
        found.emplace_back(ftime, std::move(project));
    }
    if (ec) {
        std::cerr << "[FileWikiCacheRepository] Error scanning " << m_cacheDir.string() << ": " << ec.message() << std::endl;
    }

    // Sort by most recent first
    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second.id < b.second.id;
    });
    for (auto& item : found) {
        projects.push_back(std::move(item.second));
    }
    std::cout << "[FileWikiCacheRepository] Found " << projects.size() << " processed project entries." << std::endl;
    return projects;
}

} // namespace wikiembed::infrastructure
