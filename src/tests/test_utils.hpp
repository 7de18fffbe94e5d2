#ifndef CHUNKLINE_TEST_UTILS_HPP
#define CHUNKLINE_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <zlib.h>
#include "logger/logger.hpp"

// Console logging for test runs; warnings and above keep the output readable
inline void init_test_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
    chunkline::logging::init_console_logging(level);
}

// Unique path under the system temp directory
inline std::filesystem::path temp_path(const std::string& name) {
    static int counter = 0;
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
        ("chunkline_" + std::to_string(stamp) + "_" + std::to_string(++counter) + "_" + name);
}

// Writes `content` gzip-compressed to `path`
inline bool write_gzip(const std::filesystem::path& path, const std::string& content) {
    gzFile out = gzopen(path.string().c_str(), "wb");
    if (out == nullptr) {
        return false;
    }
    const int written = gzwrite(out, content.data(), static_cast<unsigned>(content.size()));
    const int closed = gzclose(out);
    return written == static_cast<int>(content.size()) && closed == Z_OK;
}

#endif // CHUNKLINE_TEST_UTILS_HPP
