#ifndef CHUNKLINE_PIPELINE_STATE_HPP
#define CHUNKLINE_PIPELINE_STATE_HPP

#include <mutex>
#include <ostream>
#include <string>

namespace chunkline {
namespace pipeline {

/**
 * PipelineState tracks the lifecycle of a running pipeline.
 * All transitions are guarded by a single mutex so that the error flag, the
 * draining decision and the finished decision each happen exactly once,
 * whichever thread gets there first.
 */
class PipelineState {
public:
    /**
     * Pipeline states:
     * RUNNING  - Reading and transforming input
     * DRAINING - A stop condition was observed, in-flight chunks still completing
     * FINISHED - Output closed, no further activity
     */
    enum class State {
        RUNNING,
        DRAINING,
        FINISHED
    };

    /**
     * First stop condition observed while RUNNING.
     */
    enum class Reason {
        NONE,
        END_OF_STREAM,
        SOURCE_ERROR,
        TRANSFORM_ERROR,
        CANCELLED
    };

    PipelineState() = default;

    PipelineState(const PipelineState&) = delete;
    PipelineState& operator=(const PipelineState&) = delete;

    State get_state() const;
    Reason get_reason() const;
    bool is_finished() const;
    bool has_error() const;

    /**
     * RUNNING -> DRAINING.
     * @return true if this call performed the transition
     */
    bool begin_draining(Reason reason);

    /**
     * Declares the pipeline-ending transform error. Also begins draining.
     * The reason becomes TRANSFORM_ERROR even when draining had already begun.
     * @return true for the single caller that set the flag
     */
    bool raise_error();

    /**
     * Moves to FINISHED from any other state.
     * @return true if this call performed the transition
     */
    bool finish();

    static bool is_valid_transition(State from, State to);
    static std::string state_to_string(State state);
    static std::string reason_to_string(Reason reason);

    std::string get_state_string() const;

private:
    bool transition_to(State new_state);

    mutable std::mutex mutex_;
    State current_state_{State::RUNNING};
    Reason reason_{Reason::NONE};
    bool has_error_{false};
};

inline std::ostream& operator<<(std::ostream& os, const PipelineState::State& state) {
    os << PipelineState::state_to_string(state);
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const PipelineState::Reason& reason) {
    os << PipelineState::reason_to_string(reason);
    return os;
}

} // namespace pipeline
} // namespace chunkline

#endif // CHUNKLINE_PIPELINE_STATE_HPP
