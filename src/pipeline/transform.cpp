#include "pipeline/transform.hpp"

namespace chunkline {
namespace pipeline {

TransformOutcome<std::string> trim_newline(const std::string& line) {
  std::string::size_type end = line.find_last_not_of('\n');
  if (end == std::string::npos) {
    return TransformOutcome<std::string>::keep(std::string());
  }
  return TransformOutcome<std::string>::keep(line.substr(0, end + 1));
}

} // namespace pipeline
} // namespace chunkline
