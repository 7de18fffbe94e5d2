#include "pipeline/config.hpp"
#include <thread>

namespace chunkline {
namespace pipeline {

PipelineConfig PipelineConfig::normalized() const {
  PipelineConfig config = *this;
  if (config.buffer_size < 1) {
    config.buffer_size = 1;
  }
  if (config.chunk_size < 1) {
    config.chunk_size = 1;
  }
  return config;
}

std::size_t PipelineConfig::default_buffer_size() {
  const unsigned int cpus = std::thread::hardware_concurrency();
  return cpus == 0 ? 1 : cpus;
}

std::ostream& operator<<(std::ostream& os, const PipelineConfig& config) {
  os << "buffer_size=" << config.buffer_size << " chunk_size=" << config.chunk_size;
  return os;
}

} // namespace pipeline
} // namespace chunkline
