#ifndef CHUNKLINE_CHUNK_HPP
#define CHUNKLINE_CHUNK_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "pipeline/pipeline_error.hpp"

namespace chunkline {
namespace pipeline {

using SequenceNumber = std::uint64_t;

// A group of consecutive raw lines as read from the source
struct LineChunk {
    SequenceNumber id{0};
    std::vector<std::string> lines;
    // Set on the last chunk of a stream that ended by read failure or cancellation
    std::optional<ChunkError> status;

    bool is_terminal() const { return status.has_value(); }
};

// Transformed values of one LineChunk, carrying the same sequence number
template <typename T>
struct ResultChunk {
    SequenceNumber id{0};
    std::vector<T> data;
    std::optional<ChunkError> error;

    bool ok() const { return !error.has_value(); }
};

// Raises ChunkFailure when the chunk carries an error
template <typename T>
void throw_if_error(const ResultChunk<T>& chunk) {
    if (chunk.error) {
        throw ChunkFailure(*chunk.error);
    }
}

} // namespace pipeline
} // namespace chunkline

#endif // CHUNKLINE_CHUNK_HPP
