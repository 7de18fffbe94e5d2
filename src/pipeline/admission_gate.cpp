#include "pipeline/admission_gate.hpp"
#include <boost/log/trivial.hpp>

namespace chunkline {
namespace pipeline {

AdmissionGate::AdmissionGate(std::size_t slots, std::size_t window)
  : slots_(slots == 0 ? 1 : slots)
  , window_(window) {}

bool AdmissionGate::acquire(SequenceNumber id) {
  std::unique_lock<std::mutex> lock(mutex_);
  changed_.wait(lock, [this, id]() { return closed_ || admissible(id); });
  if (closed_) {
    return false;
  }
  ++in_use_;
  return true;
}

void AdmissionGate::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ == 0) {
      BOOST_LOG_TRIVIAL(warning) << "AdmissionGate: Release without matching acquire ignored";
      return;
    }
    --in_use_;
  }
  changed_.notify_all();
}

void AdmissionGate::advance(SequenceNumber next_expected) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (next_expected <= next_expected_) {
      return;
    }
    next_expected_ = next_expected;
  }
  changed_.notify_all();
}

void AdmissionGate::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
  }
  BOOST_LOG_TRIVIAL(debug) << "AdmissionGate: Closed";
  changed_.notify_all();
}

std::size_t AdmissionGate::in_use() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_use_;
}

bool AdmissionGate::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

bool AdmissionGate::admissible(SequenceNumber id) const {
  if (in_use_ >= slots_) {
    return false;
  }
  return window_ == 0 || id < next_expected_ + window_;
}

} // namespace pipeline
} // namespace chunkline
