#ifndef CHUNKLINE_ADMISSION_GATE_HPP
#define CHUNKLINE_ADMISSION_GATE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include "pipeline/chunk.hpp"

namespace chunkline {
namespace pipeline {

/**
 * Bounds the chunks a pool works on.
 *
 * Slots limit how many chunks are transformed at once. With a non-zero
 * window, chunk `id` is also held back until id < next_expected + window,
 * where next_expected is the lowest chunk not yet delivered downstream
 * (reported through advance()). Together they cap how many finished chunks
 * can wait out of order.
 */
class AdmissionGate {
public:
    // window == 0 leaves admission unbounded by sequence number
    explicit AdmissionGate(std::size_t slots, std::size_t window = 0);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // Blocks until a slot is free and `id` is inside the window, then takes the slot.
    // Returns false without a slot once the gate is closed.
    bool acquire(SequenceNumber id);
    void release();

    // Moves the window; `next_expected` never goes backwards
    void advance(SequenceNumber next_expected);

    // Fails pending and future acquires
    void close();

    std::size_t in_use() const;
    std::size_t capacity() const { return slots_; }
    std::size_t window() const { return window_; }
    bool closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable changed_;
    const std::size_t slots_;
    const std::size_t window_;
    std::size_t in_use_{0};
    SequenceNumber next_expected_{0};
    bool closed_{false};

    // Caller holds mutex_
    bool admissible(SequenceNumber id) const;
};

} // namespace pipeline
} // namespace chunkline

#endif // CHUNKLINE_ADMISSION_GATE_HPP
