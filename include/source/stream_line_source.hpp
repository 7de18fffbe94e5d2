#ifndef CHUNKLINE_STREAM_LINE_SOURCE_HPP
#define CHUNKLINE_STREAM_LINE_SOURCE_HPP

#include <istream>
#include <memory>
#include <string>
#include "source/line_source.hpp"

namespace chunkline {
namespace source {

// Adapts a std::istream. Lines are split on '\n', which is kept.
class StreamLineSource : public LineSource {
public:
    explicit StreamLineSource(std::unique_ptr<std::istream> stream, std::string name = "stream");

    // Convenience for in-memory text
    static std::unique_ptr<StreamLineSource> from_string(const std::string& text);

    ReadStatus read_line(std::string& line) override;
    void close() override;
    std::string last_error() const override { return last_error_; }
    std::string name() const override { return name_; }

    bool is_open() const { return stream_ != nullptr; }

private:
    std::unique_ptr<std::istream> stream_;
    std::string name_;
    std::string last_error_;
};

} // namespace source
} // namespace chunkline

#endif // CHUNKLINE_STREAM_LINE_SOURCE_HPP
