/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <iostream>
#include <system_error>
#include <thread>

namespace wikiembed::infrastructure {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned long long> g_tempCounter{0};

fs::path MakeTempPath(const fs::path& finalPath) {
    // filename.<timestamp>.<thread>.<seq>.tmp, unique per operation
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto threadTag = std::hash<std::thread::id>{}(std::this_thread::get_id());
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(threadTag) + "."
              + std::to_string(g_tempCounter.fetch_add(1)) + ".tmp";
    return tempPath;
}

void Fail(std::string* errorOut, const std::string& message) {
    std::cerr << "[AtomicFileWriter] " << message << std::endl;
    if (errorOut) *errorOut = message;
}

} // namespace

bool AtomicFileWriter::Write(const fs::path& target, const std::string& content, std::string* errorOut) {
    fs::path finalPath = target;
    fs::path tempPath = MakeTempPath(finalPath);

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        Fail(errorOut, std::string("Error creating directories: ") + e.what());
        return false;
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            Fail(errorOut, "Failed to open temp file: " + tempPath.string());
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            Fail(errorOut, "Write failed during output: " + tempPath.string());
            return false;
        }
    } // Close happens here automatically

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        Fail(errorOut, "Rename failed: " + ec.message());
        return false;
    }
    return true;
}

} // namespace wikiembed::infrastructure
