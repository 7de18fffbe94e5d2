#ifndef CHUNKLINE_PIPELINE_ERROR_HPP
#define CHUNKLINE_PIPELINE_ERROR_HPP

#include <ostream>
#include <stdexcept>
#include <string>

namespace chunkline::pipeline {

enum class ErrorCode {
    CANCELLED,
    SOURCE_FAILED,
    TRANSFORM_FAILED
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::SOURCE_FAILED: return "Source failed";
        case ErrorCode::TRANSFORM_FAILED: return "Transform failed";
        default: return "Undefined error";
    }
}

// Error attached to a result chunk. Every terminal condition of the pipeline
// reaches the consumer as one of these.
struct ChunkError {
    ErrorCode code;
    std::string message;

    bool is_cancellation() const { return code == ErrorCode::CANCELLED; }

    std::string to_string() const {
        return std::string(error_code_to_string(code)) + ": " + message;
    }
};

inline bool operator==(const ChunkError& lhs, const ChunkError& rhs) {
    return lhs.code == rhs.code && lhs.message == rhs.message;
}

inline bool operator!=(const ChunkError& lhs, const ChunkError& rhs) {
    return !(lhs == rhs);
}

inline std::ostream& operator<<(std::ostream& os, const ChunkError& error) {
    os << error.to_string();
    return os;
}

// The well-known error delivered when the pipeline stops on request
inline ChunkError cancelled_error() {
    return ChunkError{ErrorCode::CANCELLED, "reading canceled"};
}

class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message)
        : std::runtime_error(message) {}
};

class SourceOpenError : public PipelineError {
public:
    explicit SourceOpenError(const std::string& message)
        : PipelineError("Source open error: " + message) {}
};

class ChunkFailure : public PipelineError {
public:
    explicit ChunkFailure(const ChunkError& error)
        : PipelineError(error.to_string())
        , error_(error) {}

    const ChunkError& error() const { return error_; }

private:
    ChunkError error_;
};

} // namespace chunkline::pipeline

#endif // CHUNKLINE_PIPELINE_ERROR_HPP
