#ifndef CHUNKLINE_COLLECTOR_HPP
#define CHUNKLINE_COLLECTOR_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <utility>
#include <boost/log/trivial.hpp>
#include "pipeline/channel.hpp"
#include "pipeline/chunk.hpp"
#include "pipeline/pipeline_state.hpp"

namespace chunkline {
namespace pipeline {

/**
 * Restores sequence order of result chunks arriving from concurrent workers
 * and republishes them on the output channel.
 *
 * The collector owns the pipeline state and the output channel; it is the
 * only component that finishes the pipeline and closes the output.
 * After an error chunk arrives nothing numbered past it is published: lower
 * numbered chunks still in flight are forwarded in order as they complete,
 * then the error chunk, then the output is closed.
 */
template <typename T>
class Collector {
public:
    // Called with the new next expected id after every forwarded chunk
    using ForwardListener = std::function<void(SequenceNumber)>;

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit Collector(std::size_t output_capacity)
        : output_(output_capacity) {}

    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;


    // Must be set before run() starts
    void set_forward_listener(ForwardListener listener) {
        on_forward_ = std::move(listener);
    }


    // ---- COLLECTION METHODS ----
    // Consumes `in` until it is closed, then finishes the pipeline
    void run(Channel<ResultChunk<T>>& in) {
        ResultChunk<T> chunk;
        while (in.consume(chunk)) {
            accept(std::move(chunk));
            chunk = ResultChunk<T>();
        }
        flush();
        finish();
    }

    // Handles one result chunk in arrival order
    void accept(ResultChunk<T> chunk) {
        if (terminal_ && chunk.id > terminal_->id) {
            BOOST_LOG_TRIVIAL(debug) << "Collector: Dropping chunk " << chunk.id
                                     << " past terminal chunk " << terminal_->id;
            return;
        }

        if (chunk.id < next_expected_ || pending_.count(chunk.id) > 0) {
            BOOST_LOG_TRIVIAL(warning) << "Collector: Duplicate chunk " << chunk.id << " ignored";
            return;
        }

        if (chunk.error) {
            BOOST_LOG_TRIVIAL(info) << "Collector: Terminal chunk " << chunk.id << " (" << *chunk.error << ")";
            terminal_ = std::move(chunk);
            // Anything already buffered beyond the new terminal point is never published
            pending_.erase(pending_.upper_bound(terminal_->id), pending_.end());
            return;
        }

        if (chunk.id == next_expected_) {
            forward(std::move(chunk));
            drain_contiguous();
        } else {
            BOOST_LOG_TRIVIAL(trace) << "Collector: Holding chunk " << chunk.id
                                     << ", waiting for " << next_expected_;
            pending_.emplace(chunk.id, std::move(chunk));
        }
    }

    // Publishes whatever is left, in ascending order, ending with the terminal chunk
    void flush() {
        drain_contiguous();

        if (!pending_.empty()) {
            BOOST_LOG_TRIVIAL(warning) << "Collector: Sequence gap at " << next_expected_ << ", flushing "
                                       << pending_.size() << " buffered chunk(s) in order";
            for (auto& entry : pending_) {
                forward(std::move(entry.second));
            }
            pending_.clear();
        }

        if (terminal_) {
            ResultChunk<T> last = std::move(*terminal_);
            terminal_.reset();
            forward(std::move(last));
        }
    }

    // Closes the output exactly once
    void finish() {
        state_.begin_draining(PipelineState::Reason::END_OF_STREAM);
        if (state_.finish()) {
            output_.close();
            BOOST_LOG_TRIVIAL(info) << "Collector: Output closed after " << forwarded_ << " chunk(s)";
        }
    }


    // ---- ACCESSORS ----
    PipelineState& state() { return state_; }
    const PipelineState& state() const { return state_; }
    Channel<ResultChunk<T>>& output() { return output_; }

    SequenceNumber next_expected() const { return next_expected_; }
    std::size_t pending() const { return pending_.size(); }
    std::size_t forwarded() const { return forwarded_; }

private:
    // ---- PARAMETERS ----
    PipelineState state_;
    Channel<ResultChunk<T>> output_;
    std::map<SequenceNumber, ResultChunk<T>> pending_;
    std::optional<ResultChunk<T>> terminal_;
    SequenceNumber next_expected_{0};
    std::size_t forwarded_{0};
    ForwardListener on_forward_;


    void forward(ResultChunk<T> chunk) {
        const SequenceNumber id = chunk.id;
        if (!output_.produce(std::move(chunk))) {
            BOOST_LOG_TRIVIAL(error) << "Collector: Output closed, chunk " << id << " lost";
            return;
        }
        next_expected_ = id + 1;
        ++forwarded_;
        BOOST_LOG_TRIVIAL(trace) << "Collector: Forwarded chunk " << id;
        if (on_forward_) {
            on_forward_(next_expected_);
        }
    }

    void drain_contiguous() {
        auto it = pending_.begin();
        while (it != pending_.end() && it->first == next_expected_) {
            forward(std::move(it->second));
            it = pending_.erase(it);
        }
    }
};

} // namespace pipeline
} // namespace chunkline

#endif // CHUNKLINE_COLLECTOR_HPP
