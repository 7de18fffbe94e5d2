#ifndef CHUNKLINE_FILE_LINE_SOURCE_HPP
#define CHUNKLINE_FILE_LINE_SOURCE_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <zlib.h>
#include "source/line_source.hpp"

namespace chunkline {
namespace source {

/**
 * Reads lines from a file through zlib, so gzip-compressed input is
 * decompressed transparently and plain files pass through unchanged.
 * The path "-" reads standard input.
 */
class FileLineSource : public LineSource {
public:
    static constexpr const char* STDIN_PATH = "-";
    static constexpr unsigned int READ_BUFFER_SIZE = 128 * 1024;

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    // Throws SourceOpenError if the file cannot be opened
    explicit FileLineSource(const std::string& path);
    ~FileLineSource() override;

    FileLineSource(const FileLineSource&) = delete;
    FileLineSource& operator=(const FileLineSource&) = delete;


    // ---- LINE SOURCE INTERFACE ----
    ReadStatus read_line(std::string& line) override;
    void close() override;
    std::string last_error() const override { return last_error_; }
    std::string name() const override { return path_; }


    // ---- QUERY METHODS ----
    bool is_open() const { return file_ != nullptr; }
    bool is_compressed() const { return compressed_; }

private:
    // ---- PARAMETERS ----
    std::string path_;
    gzFile file_{nullptr};
    bool compressed_{false};
    // Decompressed bytes not yet handed out: [buffer_pos_, buffer_end_)
    std::vector<char> buffer_;
    std::size_t buffer_pos_{0};
    std::size_t buffer_end_{0};
    std::string last_error_;

    std::string describe_gz_error();
};

} // namespace source
} // namespace chunkline

#endif // CHUNKLINE_FILE_LINE_SOURCE_HPP
