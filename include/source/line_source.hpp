#ifndef CHUNKLINE_LINE_SOURCE_HPP
#define CHUNKLINE_LINE_SOURCE_HPP

#include <string>

namespace chunkline {
namespace source {

enum class ReadStatus {
    LINE,
    END_OF_STREAM,
    ERROR
};

inline const char* read_status_to_string(ReadStatus status) {
    switch (status) {
        case ReadStatus::LINE: return "Line";
        case ReadStatus::END_OF_STREAM: return "End of stream";
        case ReadStatus::ERROR: return "Error";
        default: return "Undefined status";
    }
}

/**
 * A resource yielding successive lines of text.
 * Line framing is up to the implementation; lines are returned with their
 * terminator, the last line of a stream may lack one.
 */
class LineSource {
public:
    virtual ~LineSource() = default;

    // Reads the next line into `line`. On ERROR, last_error() describes the failure.
    virtual ReadStatus read_line(std::string& line) = 0;
    // Releases the underlying resource. Safe to call more than once.
    virtual void close() = 0;

    virtual std::string last_error() const = 0;
    // Human readable name used in log messages
    virtual std::string name() const = 0;
};

} // namespace source
} // namespace chunkline

#endif // CHUNKLINE_LINE_SOURCE_HPP
