#ifndef CHUNKLINE_LINE_CHUNKER_HPP
#define CHUNKLINE_LINE_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "pipeline/cancel_signal.hpp"
#include "pipeline/channel.hpp"
#include "pipeline/chunk.hpp"
#include "pipeline/pipeline_state.hpp"
#include "source/line_source.hpp"

namespace chunkline {
namespace pipeline {

/**
 * Groups the lines of a source into sequence-numbered chunks.
 * The chunker owns the source and closes it exactly once, whichever way
 * reading ends: end of stream, read failure, cancellation, or a halt
 * requested by a failed pipeline.
 */
class LineChunker {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    LineChunker(std::unique_ptr<source::LineSource> source,
                std::size_t chunk_size,
                const CancelSignal& cancel,
                PipelineState& state);
    ~LineChunker();

    LineChunker(const LineChunker&) = delete;
    LineChunker& operator=(const LineChunker&) = delete;


    // ---- CHUNKING METHODS ----
    // Produces the next chunk. Returns false once the stream has ended.
    bool next(LineChunk& chunk);
    // Hands every chunk to `out`, then closes it
    void run(Channel<LineChunk>& out);


    // ---- QUERY METHODS ----
    bool done() const { return done_; }
    std::uint64_t lines_read() const { return lines_read_; }
    std::uint64_t chunks_emitted() const { return next_id_; }
    std::size_t chunk_size() const { return chunk_size_; }

private:
    // ---- PARAMETERS ----
    std::unique_ptr<source::LineSource> source_;
    const std::size_t chunk_size_;
    const CancelSignal& cancel_;
    PipelineState& state_;
    Channel<LineChunk>* downstream_{nullptr};

    SequenceNumber next_id_{0};
    std::uint64_t lines_read_{0};
    bool done_{false};
    bool source_closed_{false};


    // ---- HELPERS ----
    // True when a failed pipeline no longer wants input
    bool halted() const;
    void seal(LineChunk& chunk, std::vector<std::string>& buffer, std::optional<ChunkError> status);
    void stop();
    void close_source();
};

} // namespace pipeline
} // namespace chunkline

#endif // CHUNKLINE_LINE_CHUNKER_HPP
