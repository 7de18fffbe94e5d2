#include "pipeline/cancel_signal.hpp"
#include <boost/log/trivial.hpp>

namespace chunkline {
namespace pipeline {

bool CancelSignal::request() {
  if (requested_.exchange(true, std::memory_order_acq_rel)) {
    BOOST_LOG_TRIVIAL(debug) << "CancelSignal: Cancellation already requested";
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "CancelSignal: Cancellation requested";
  return true;
}

bool CancelSignal::is_requested() const {
  return requested_.load(std::memory_order_acquire);
}

} // namespace pipeline
} // namespace chunkline
