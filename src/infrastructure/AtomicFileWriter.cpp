/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace habitpoints::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path TempPathFor(const fs::path& target) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path temp = target;
    temp += "." + std::to_string(stamp) + ".tmp";
    return temp;
}

void DiscardTemp(const fs::path& temp) {
    std::error_code ignored;
    fs::remove(temp, ignored);
}

} // namespace

bool AtomicFileWriter::Write(const std::string& filename, const std::string& content) {
    const fs::path target = filename;

    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            std::cerr << "[AtomicFileWriter] Cannot create " << target.parent_path() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    const fs::path temp = TempPathFor(target);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "[AtomicFileWriter] Cannot open " << temp << std::endl;
            return false;
        }
        out << content;
        out.flush();
        if (!out) {
            std::cerr << "[AtomicFileWriter] Short write to " << temp << std::endl;
            out.close();
            DiscardTemp(temp);
            return false;
        }
    }

    // Readers see either the old file or the complete new one
    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::cerr << "[AtomicFileWriter] Cannot replace " << target << ": " << ec.message() << std::endl;
        DiscardTemp(temp);
        return false;
    }
    return true;
}

} // namespace habitpoints::infrastructure
