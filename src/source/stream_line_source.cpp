#include "source/stream_line_source.hpp"
#include <boost/log/trivial.hpp>
#include <sstream>

namespace chunkline {
namespace source {

StreamLineSource::StreamLineSource(std::unique_ptr<std::istream> stream, std::string name)
  : stream_(std::move(stream))
  , name_(std::move(name)) {}

std::unique_ptr<StreamLineSource> StreamLineSource::from_string(const std::string& text) {
  return std::make_unique<StreamLineSource>(std::make_unique<std::istringstream>(text), "string");
}

ReadStatus StreamLineSource::read_line(std::string& line) {
  line.clear();
  if (!stream_) {
    last_error_ = "read from closed source";
    return ReadStatus::ERROR;
  }

  if (!std::getline(*stream_, line)) {
    if (stream_->bad()) {
      last_error_ = "stream read failure";
      BOOST_LOG_TRIVIAL(error) << "StreamLineSource: Read failed on " << name_;
      return ReadStatus::ERROR;
    }
    return ReadStatus::END_OF_STREAM;
  }

  // getline() hits end-of-file only when the last line has no terminator
  if (!stream_->eof()) {
    line.push_back('\n');
  }
  return ReadStatus::LINE;
}

void StreamLineSource::close() {
  if (stream_) {
    stream_.reset();
    BOOST_LOG_TRIVIAL(debug) << "StreamLineSource: Closed " << name_;
  }
}

} // namespace source
} // namespace chunkline
