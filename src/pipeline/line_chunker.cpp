#include "pipeline/line_chunker.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace chunkline {
namespace pipeline {

namespace {
// Upper bound on the up-front reservation for a chunk buffer
constexpr std::size_t MAX_RESERVE = 4096;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LineChunker::LineChunker(std::unique_ptr<source::LineSource> source,
                         std::size_t chunk_size,
                         const CancelSignal& cancel,
                         PipelineState& state)
  : source_(std::move(source))
  , chunk_size_(chunk_size == 0 ? 1 : chunk_size)
  , cancel_(cancel)
  , state_(state) {
  BOOST_LOG_TRIVIAL(debug) << "LineChunker: Reading " << (source_ ? source_->name() : "<none>")
                           << " in chunks of " << chunk_size_ << " line(s)";
}

LineChunker::~LineChunker() {
  close_source();
}


//==============================================
// CHUNKING METHODS
//==============================================

bool LineChunker::next(LineChunk& chunk) {
  if (done_) {
    return false;
  }
  if (!source_) {
    BOOST_LOG_TRIVIAL(error) << "LineChunker: No line source";
    state_.begin_draining(PipelineState::Reason::SOURCE_ERROR);
    std::vector<std::string> empty;
    seal(chunk, empty, ChunkError{ErrorCode::SOURCE_FAILED, "no line source"});
    return true;
  }

  std::vector<std::string> buffer;
  buffer.reserve(std::min(chunk_size_, MAX_RESERVE));
  std::string line;

  while (true) {
    if (halted()) {
      BOOST_LOG_TRIVIAL(info) << "LineChunker: Pipeline failed, discarding " << buffer.size()
                              << " buffered line(s) and stopping";
      stop();
      return false;
    }

    if (cancel_.is_requested()) {
      BOOST_LOG_TRIVIAL(info) << "LineChunker: Cancelled after " << lines_read_ << " line(s)";
      state_.begin_draining(PipelineState::Reason::CANCELLED);
      seal(chunk, buffer, cancelled_error());
      return true;
    }

    switch (source_->read_line(line)) {
      case source::ReadStatus::LINE:
        ++lines_read_;
        buffer.push_back(std::move(line));
        line.clear();
        if (buffer.size() == chunk_size_) {
          chunk.id = next_id_++;
          chunk.lines = std::move(buffer);
          chunk.status.reset();
          BOOST_LOG_TRIVIAL(trace) << "LineChunker: Chunk " << chunk.id << " with " << chunk.lines.size() << " line(s)";
          return true;
        }
        break;

      case source::ReadStatus::END_OF_STREAM:
        BOOST_LOG_TRIVIAL(info) << "LineChunker: End of stream after " << lines_read_ << " line(s)";
        state_.begin_draining(PipelineState::Reason::END_OF_STREAM);
        seal(chunk, buffer, std::nullopt);
        return true;

      case source::ReadStatus::ERROR:
      default: {
        const std::string message = source_->last_error();
        BOOST_LOG_TRIVIAL(error) << "LineChunker: Read failed after " << lines_read_ << " line(s): " << message;
        state_.begin_draining(PipelineState::Reason::SOURCE_ERROR);
        seal(chunk, buffer, ChunkError{ErrorCode::SOURCE_FAILED, message});
        return true;
      }
    }
  }
}

void LineChunker::run(Channel<LineChunk>& out) {
  downstream_ = &out;
  LineChunk chunk;
  while (next(chunk)) {
    const SequenceNumber id = chunk.id;
    if (!out.produce(std::move(chunk))) {
      BOOST_LOG_TRIVIAL(debug) << "LineChunker: Downstream closed, chunk " << id << " not delivered";
      stop();
      break;
    }
  }
  downstream_ = nullptr;
  out.close();
  BOOST_LOG_TRIVIAL(debug) << "LineChunker: Finished with " << next_id_ << " chunk(s)";
}


//==============================================
// HELPERS
//==============================================

bool LineChunker::halted() const {
  return state_.has_error() || (downstream_ != nullptr && downstream_->closed());
}

// Emits the final chunk of the stream and releases the source
void LineChunker::seal(LineChunk& chunk, std::vector<std::string>& buffer, std::optional<ChunkError> status) {
  chunk.id = next_id_++;
  chunk.lines = std::move(buffer);
  chunk.status = std::move(status);
  BOOST_LOG_TRIVIAL(debug) << "LineChunker: Final chunk " << chunk.id << " with " << chunk.lines.size()
                           << " line(s)" << (chunk.status ? " [" + chunk.status->to_string() + "]" : "");
  stop();
}

void LineChunker::stop() {
  done_ = true;
  close_source();
}

void LineChunker::close_source() {
  if (source_closed_ || !source_) {
    return;
  }
  source_closed_ = true;
  source_->close();
}

} // namespace pipeline
} // namespace chunkline
