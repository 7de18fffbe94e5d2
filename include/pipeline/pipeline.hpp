#ifndef CHUNKLINE_PIPELINE_HPP
#define CHUNKLINE_PIPELINE_HPP

#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <boost/log/trivial.hpp>
#include "pipeline/cancel_signal.hpp"
#include "pipeline/channel.hpp"
#include "pipeline/chunk.hpp"
#include "pipeline/collector.hpp"
#include "pipeline/config.hpp"
#include "pipeline/line_chunker.hpp"
#include "pipeline/pipeline_state.hpp"
#include "pipeline/transform.hpp"
#include "pipeline/transform_pool.hpp"
#include "source/file_line_source.hpp"
#include "source/line_source.hpp"

namespace chunkline {
namespace pipeline {

/**
 * Order-preserving concurrent line pipeline.
 *
 *   LineChunker -> TransformPool -> Collector -> output -> consumer
 *
 * Construction starts the stages. The consumer drains result chunks with
 * next() or try_next() until they report the end, checking each chunk's
 * error; the last chunk carries the terminal error, if any.
 *
 * cancel() is cooperative: transform calls already running are not
 * interrupted, so a transform that never returns delays shutdown.
 */
template <typename T>
class Pipeline {
public:
    using Chunk = ResultChunk<T>;
    using PollStatus = typename Channel<Chunk>::PollStatus;

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    Pipeline(std::unique_ptr<source::LineSource> source, PipelineConfig config, TransformFn<T> transform)
        : config_(config.normalized())
        , collector_(config_.buffer_size)
        , work_(config_.buffer_size)
        , results_(config_.buffer_size)
        , chunker_(std::move(source), config_.chunk_size, cancel_, collector_.state())
        , pool_(config_.buffer_size, std::move(transform), collector_.state(), config_.buffer_size) {
        BOOST_LOG_TRIVIAL(info) << "Pipeline: Starting with " << config_;
        // Out-of-order results wait in the collector; the pool only runs ahead of it by buffer_size chunks
        collector_.set_forward_listener([this](SequenceNumber next_expected) {
            pool_.advance_window(next_expected);
        });
        chunker_thread_ = std::thread([this]() { chunker_.run(work_); });
        pool_thread_ = std::thread([this]() { pool_.run(work_, results_); });
        collector_thread_ = std::thread([this]() { collector_.run(results_); });
    }

    // Cancels, discards undelivered chunks, and waits for every stage
    ~Pipeline() {
        cancel();
        Chunk discarded;
        while (collector_.output().consume(discarded)) {
        }
        join(chunker_thread_);
        join(pool_thread_);
        join(collector_thread_);
        BOOST_LOG_TRIVIAL(debug) << "Pipeline: Stopped";
    }

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Reads a plain or gzip-compressed file, "-" for standard input.
    // Throws SourceOpenError if the file cannot be opened.
    static std::unique_ptr<Pipeline<T>> open(const std::string& path, PipelineConfig config, TransformFn<T> transform) {
        auto source = std::make_unique<source::FileLineSource>(path);
        return std::make_unique<Pipeline<T>>(std::move(source), config, std::move(transform));
    }


    // ---- CONSUMER METHODS ----
    // Blocks for the next chunk in order. Returns false once the pipeline is finished.
    bool next(Chunk& chunk) {
        return collector_.output().consume(chunk);
    }

    // Non-blocking poll: READY with a chunk, EMPTY if none is ready yet, CLOSED when finished
    PollStatus try_next(Chunk& chunk) {
        return collector_.output().try_consume(chunk);
    }

    // Requests a stop. Safe to call any number of times, from any thread.
    void cancel() {
        if (collector_.state().is_finished()) {
            BOOST_LOG_TRIVIAL(debug) << "Pipeline: Cancel ignored, already finished";
            return;
        }
        cancel_.request();
    }


    // ---- QUERY METHODS ----
    bool is_finished() const { return collector_.state().is_finished(); }
    PipelineState::State state() const { return collector_.state().get_state(); }
    PipelineState::Reason stop_reason() const { return collector_.state().get_reason(); }
    const PipelineConfig& config() const { return config_; }

private:
    // ---- PARAMETERS ----
    // Declaration order is construction order: the stages reference the ones above them
    const PipelineConfig config_;
    CancelSignal cancel_;
    Collector<T> collector_;
    Channel<LineChunk> work_;
    Channel<Chunk> results_;
    LineChunker chunker_;
    TransformPool<T> pool_;

    std::thread chunker_thread_;
    std::thread pool_thread_;
    std::thread collector_thread_;

    static void join(std::thread& thread) {
        if (thread.joinable()) {
            thread.join();
        }
    }
};

// Default config, lines kept without their trailing newline
inline std::unique_ptr<Pipeline<std::string>> open_default(const std::string& path) {
    return Pipeline<std::string>::open(path, PipelineConfig{}, trim_newline);
}

} // namespace pipeline
} // namespace chunkline

#endif // CHUNKLINE_PIPELINE_HPP
