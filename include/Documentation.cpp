// ---- PIPELINE ----
// Channel Documentation
/*
DOCUMENTATION:
CLASS: Channel<T> (bounded blocking queue)

VARIABLES:
  . size_t capacity_
      - Maximum number of queued items, at least 1
  . queue<T> queue_
      - Items waiting for a consumer
  . bool closed_
      - Set once by close()
  . mutex mutex_, condition_variable not_empty_, not_full_

METHODS:
  . bool produce(T item)
      - Blocks while full
      - Returns false once the channel is closed; the item is dropped
  . bool consume(T& item)
      - Blocks while empty
      - Returns false once closed and drained
  . PollStatus try_consume(T& item)
      - READY, EMPTY or CLOSED without blocking
  . bool close()
      - Wakes every waiter; only the first call returns true
*/

// LineChunker Documentation
/*
DOCUMENTATION:
CLASS: LineChunker

VARIABLES:
  . unique_ptr<LineSource> source_
      - Owned; closed exactly once
  . size_t chunk_size_
      - Lines per chunk
  . const CancelSignal& cancel_
  . PipelineState& state_
  . SequenceNumber next_id_
      - Id of the next chunk, starting at 0

METHODS:
  . bool next(LineChunk& chunk)
      - Full buffer: emits a chunk with no status
      - End of stream: emits the buffered lines, possibly none
      - Read failure: emits the buffered lines with SOURCE_FAILED
      - Cancel requested: emits the buffered lines with CANCELLED
      - Failed pipeline: stops without a chunk
  . void run(Channel<LineChunk>& out)
      - Produces until next() is done, then closes out
*/

// TransformPool Documentation
/*
DOCUMENTATION:
CLASS: TransformPool<T>

VARIABLES:
  . size_t concurrency_
      - Worker threads and admission slots
  . TransformFn<T> transform_
  . AdmissionGate gate_
      - Bounds chunks in flight and, with a window, how far past
        next_expected a chunk may be admitted
  . boost::asio::thread_pool workers_

METHODS:
  . void run(Channel<LineChunk>& in, Channel<ResultChunk<T>>& out)
      - Admits chunks one slot at a time
      - Discards queued chunks once an error was raised
      - Joins the workers and closes out
  . ResultChunk<T> process(LineChunk chunk) const
      - Keeps, skips or fails line by line
      - Anything thrown counts as a failure
  . void advance_window(SequenceNumber next_expected)
      - Called by the collector after each forwarded chunk
      - Transform failure takes precedence over the chunk status
*/

// Collector Documentation
/*
DOCUMENTATION:
CLASS: Collector<T>

VARIABLES:
  . PipelineState state_
      - Shared with the chunker and the pool
  . Channel<ResultChunk<T>> output_
      - What the consumer drains
  . map<SequenceNumber, ResultChunk<T>> pending_
      - Early arrivals
  . optional<ResultChunk<T>> terminal_
      - Lowest numbered error chunk seen

METHODS:
  . void accept(ResultChunk<T> chunk)
      - Forwards in sequence, holds early chunks, ignores duplicates
      - Drops chunks numbered past the terminal chunk
  . void flush()
      - Forwards what is left, the terminal chunk last
  . void set_forward_listener(ForwardListener listener)
      - Told the new next expected id after every forward
  . void finish()
      - Moves the state to FINISHED and closes the output once
*/

// Pipeline Documentation
/*
DOCUMENTATION:
CLASS: Pipeline<T>

CONSTRUCTOR:
  . Pipeline(unique_ptr<LineSource> source, PipelineConfig config, TransformFn<T> transform)
      - Normalizes the config
      - Starts the chunker, pool and collector threads
  . static open(const string& path, PipelineConfig config, TransformFn<T> transform)
      - Plain or gzip file, "-" for stdin
      - Throws SourceOpenError

METHODS:
  . bool next(ResultChunk<T>& chunk)
  . PollStatus try_next(ResultChunk<T>& chunk)
  . void cancel()
      - Idempotent, any thread, no-op after completion
  . ~Pipeline()
      - Cancels, drains the output and joins every thread
*/

// ---- SOURCE ----
// FileLineSource Documentation
/*
DOCUMENTATION:
CLASS: FileLineSource : LineSource

VARIABLES:
  . gzFile file_
      - zlib handle; reads gzip and plain files alike
  . bool compressed_
      - gzdirect() == 0 after opening

METHODS:
  . ReadStatus read_line(string& line)
      - LINE with the newline kept, END_OF_STREAM, or ERROR
      - gzread into buffer_, split on '\n' only; NUL bytes stay in the line
      - A truncated gzip stream is an ERROR
  . void close()
      - Idempotent
*/
