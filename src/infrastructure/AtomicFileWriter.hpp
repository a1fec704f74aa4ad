/**
 * @file AtomicFileWriter.hpp
 * @brief Synchronous whole-file writes that never leave a half-written target.
 */

#pragma once
#include <filesystem>
#include <string>

namespace wikiembed::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes content to a sibling temp file and renames it over the target.
 *
 * Readers observe either the previous file or the complete new one.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Replaces the target file with the given content.
     * @param target Final path; missing parent directories are created.
     * @param content Bytes to write.
     * @param errorOut Receives a description of the failure, if any.
     * @return True if the target now holds exactly `content`.
     */
    static bool Write(const std::filesystem::path& target, const std::string& content, std::string* errorOut = nullptr);
};

} // namespace wikiembed::infrastructure
