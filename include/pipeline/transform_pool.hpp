#ifndef CHUNKLINE_TRANSFORM_POOL_HPP
#define CHUNKLINE_TRANSFORM_POOL_HPP

#include <cstddef>
#include <exception>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>
#include "pipeline/admission_gate.hpp"
#include "pipeline/channel.hpp"
#include "pipeline/chunk.hpp"
#include "pipeline/pipeline_state.hpp"
#include "pipeline/transform.hpp"

namespace chunkline {
namespace pipeline {

/**
 * Applies a transform to line chunks on a bounded set of worker threads.
 * Each admitted chunk is handled by one worker, line by line, and yields
 * exactly one ResultChunk with the same sequence number. The first transform
 * failure stops admission of further chunks; chunks already running finish.
 *
 * With a reorder window, chunk `id` is admitted only while
 * id < next_expected + window; the downstream collector reports
 * next_expected through advance_window().
 */
template <typename T>
class TransformPool {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    TransformPool(std::size_t concurrency, TransformFn<T> transform, PipelineState& state,
                  std::size_t reorder_window = 0)
        : concurrency_(concurrency == 0 ? 1 : concurrency)
        , transform_(std::move(transform))
        , state_(state)
        , gate_(concurrency_, reorder_window)
        , workers_(concurrency_) {
        BOOST_LOG_TRIVIAL(debug) << "TransformPool: Started " << concurrency_ << " worker(s)";
    }

    ~TransformPool() {
        workers_.join();
    }

    TransformPool(const TransformPool&) = delete;
    TransformPool& operator=(const TransformPool&) = delete;


    // ---- POOL EXECUTION METHODS ----
    // Admits every chunk from `in` and publishes results to `out`.
    // Returns after all admitted chunks are done; `out` is then closed.
    void run(Channel<LineChunk>& in, Channel<ResultChunk<T>>& out) {
        LineChunk chunk;
        std::size_t admitted = 0;
        std::size_t discarded = 0;

        while (in.consume(chunk)) {
            if (state_.has_error()) {
                ++discarded;
                continue;
            }

            if (!gate_.acquire(chunk.id)) {
                ++discarded;
                continue;
            }
            // A failure may have been declared while we waited for a slot
            if (state_.has_error()) {
                gate_.release();
                ++discarded;
                continue;
            }

            ++admitted;
            BOOST_LOG_TRIVIAL(trace) << "TransformPool: Admitted chunk " << chunk.id;
            boost::asio::post(workers_, [this, job = std::move(chunk), &in, &out]() mutable {
                execute(std::move(job), in, out);
            });
            chunk = LineChunk();
        }

        workers_.join();
        out.close();
        BOOST_LOG_TRIVIAL(debug) << "TransformPool: Drained after " << admitted << " chunk(s), "
                                 << discarded << " discarded";
    }

    // Transforms the lines of one chunk in order
    ResultChunk<T> process(LineChunk chunk) const {
        ResultChunk<T> result;
        result.id = chunk.id;
        result.data.reserve(chunk.lines.size());

        for (const std::string& line : chunk.lines) {
            try {
                TransformOutcome<T> outcome = transform_(line);
                if (outcome.is_kept()) {
                    result.data.push_back(std::move(outcome).value());
                } else if (outcome.is_failed()) {
                    result.error = ChunkError{ErrorCode::TRANSFORM_FAILED, outcome.error_message()};
                    return result;
                }
            } catch (const std::exception& e) {
                result.error = ChunkError{ErrorCode::TRANSFORM_FAILED, e.what()};
                return result;
            } catch (...) {
                result.error = ChunkError{ErrorCode::TRANSFORM_FAILED, "unknown exception"};
                return result;
            }
        }

        result.error = std::move(chunk.status);
        return result;
    }


    // Lowest chunk not yet delivered downstream; moves the reorder window
    void advance_window(SequenceNumber next_expected) {
        gate_.advance(next_expected);
    }


    // ---- QUERY METHODS ----
    std::size_t concurrency() const { return concurrency_; }
    std::size_t reorder_window() const { return gate_.window(); }
    std::size_t in_flight() const { return gate_.in_use(); }

private:
    // ---- PARAMETERS ----
    const std::size_t concurrency_;
    TransformFn<T> transform_;
    PipelineState& state_;
    AdmissionGate gate_;
    boost::asio::thread_pool workers_;


    // Runs on a worker thread
    void execute(LineChunk chunk, Channel<LineChunk>& in, Channel<ResultChunk<T>>& out) {
        ResultChunk<T> result = process(std::move(chunk));

        if (result.error && result.error->code == ErrorCode::TRANSFORM_FAILED) {
            BOOST_LOG_TRIVIAL(warning) << "TransformPool: Chunk " << result.id << " failed: " << result.error->message;
            if (state_.raise_error()) {
                BOOST_LOG_TRIVIAL(error) << "TransformPool: Transform error in chunk " << result.id
                                         << ", no further chunks admitted";
                in.close();
                gate_.close();
            }
        }

        const SequenceNumber id = result.id;
        if (!out.produce(std::move(result))) {
            BOOST_LOG_TRIVIAL(warning) << "TransformPool: Result channel closed, chunk " << id << " lost";
        }
        gate_.release();
    }
};

} // namespace pipeline
} // namespace chunkline

#endif // CHUNKLINE_TRANSFORM_POOL_HPP
