#ifndef CHUNKLINE_CONFIG_HPP
#define CHUNKLINE_CONFIG_HPP

#include <cstddef>
#include <ostream>

namespace chunkline {
namespace pipeline {

struct PipelineConfig {
    static constexpr std::size_t DEFAULT_CHUNK_SIZE = 1000000;

    // Number of chunks transformed at once, also the capacity of every queue
    std::size_t buffer_size{default_buffer_size()};
    // Lines per chunk
    std::size_t chunk_size{DEFAULT_CHUNK_SIZE};

    // Copy with both parameters clamped to at least 1
    PipelineConfig normalized() const;

    // Hardware concurrency, or 1 when it cannot be determined
    static std::size_t default_buffer_size();
};

std::ostream& operator<<(std::ostream& os, const PipelineConfig& config);

} // namespace pipeline
} // namespace chunkline

#endif // CHUNKLINE_CONFIG_HPP
