#ifndef CHUNKLINE_CANCEL_SIGNAL_HPP
#define CHUNKLINE_CANCEL_SIGNAL_HPP

#include <atomic>

namespace chunkline {
namespace pipeline {

// One-shot stop request, polled by the chunker before every read
class CancelSignal {
public:
    CancelSignal() = default;

    CancelSignal(const CancelSignal&) = delete;
    CancelSignal& operator=(const CancelSignal&) = delete;

    // Raises the signal. Returns true only for the first caller.
    bool request();

    bool is_requested() const;

private:
    std::atomic<bool> requested_{false};
};

} // namespace pipeline
} // namespace chunkline

#endif // CHUNKLINE_CANCEL_SIGNAL_HPP
