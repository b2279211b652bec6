/**
 * @file AtomicFileWriter.hpp
 * @brief Temp-file + rename writes so readers never see a half-written file.
 */

#pragma once
#include <string>

namespace habitpoints::infrastructure {

class AtomicFileWriter {
public:
    /**
     * @brief Writes content to filename atomically, creating parent directories.
     * @param filename Target path.
     * @param content Full file content.
     * @return False on any failure; the reason is logged and the target left untouched.
     */
    static bool Write(const std::string& filename, const std::string& content);
};

} // namespace habitpoints::infrastructure
