#include "pipeline/pipeline_state.hpp"
#include <boost/log/trivial.hpp>

namespace chunkline {
namespace pipeline {

//==============================================
// QUERY METHODS
//==============================================

PipelineState::State PipelineState::get_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_state_;
}

PipelineState::Reason PipelineState::get_reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reason_;
}

bool PipelineState::is_finished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_state_ == State::FINISHED;
}

bool PipelineState::has_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return has_error_;
}

std::string PipelineState::get_state_string() const {
  return state_to_string(get_state());
}


//==============================================
// STATE TRANSITIONS
//==============================================

bool PipelineState::begin_draining(Reason reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!transition_to(State::DRAINING)) {
    return false;
  }
  reason_ = reason;
  BOOST_LOG_TRIVIAL(info) << "PipelineState: RUNNING -> DRAINING (" << reason_to_string(reason) << ")";
  return true;
}

bool PipelineState::raise_error() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (has_error_ || current_state_ == State::FINISHED) {
    return false;
  }
  has_error_ = true;
  // The failed chunk ends the output, so its reason replaces an earlier one
  const Reason previous = reason_;
  reason_ = Reason::TRANSFORM_ERROR;
  if (transition_to(State::DRAINING)) {
    BOOST_LOG_TRIVIAL(info) << "PipelineState: RUNNING -> DRAINING (" << reason_to_string(reason_) << ")";
  } else {
    BOOST_LOG_TRIVIAL(info) << "PipelineState: Reason " << reason_to_string(previous) << " -> "
                            << reason_to_string(reason_);
  }
  return true;
}

bool PipelineState::finish() {
  std::lock_guard<std::mutex> lock(mutex_);
  const State previous = current_state_;
  if (!transition_to(State::FINISHED)) {
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "PipelineState: " << state_to_string(previous) << " -> FINISHED";
  return true;
}

// Caller holds mutex_
bool PipelineState::transition_to(State new_state) {
  if (!is_valid_transition(current_state_, new_state)) {
    return false;
  }
  current_state_ = new_state;
  return true;
}

bool PipelineState::is_valid_transition(State from, State to) {
  switch (from) {
    case State::RUNNING:
      return to == State::DRAINING ||
             to == State::FINISHED;

    case State::DRAINING:
      return to == State::FINISHED;

    case State::FINISHED:
      return false;
  }
  return false;
}


//==============================================
// STRING CONVERSION
//==============================================

std::string PipelineState::state_to_string(State state) {
  switch (state) {
    case State::RUNNING:  return "RUNNING";
    case State::DRAINING: return "DRAINING";
    case State::FINISHED: return "FINISHED";
    default:              return "UNKNOWN";
  }
}

std::string PipelineState::reason_to_string(Reason reason) {
  switch (reason) {
    case Reason::NONE:            return "NONE";
    case Reason::END_OF_STREAM:   return "END_OF_STREAM";
    case Reason::SOURCE_ERROR:    return "SOURCE_ERROR";
    case Reason::TRANSFORM_ERROR: return "TRANSFORM_ERROR";
    case Reason::CANCELLED:       return "CANCELLED";
    default:                      return "UNKNOWN";
  }
}

} // namespace pipeline
} // namespace chunkline
