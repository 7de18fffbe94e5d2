#include "source/file_line_source.hpp"
#include "pipeline/pipeline_error.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace chunkline {
namespace source {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileLineSource::FileLineSource(const std::string& path)
  : path_(path)
  , buffer_(READ_BUFFER_SIZE) {
  BOOST_LOG_TRIVIAL(debug) << "FileLineSource: Opening " << path_;

  if (path_ == STDIN_PATH) {
    // Duplicate the descriptor so closing the source leaves stdin itself alone
    int fd = ::dup(STDIN_FILENO);
    if (fd < 0) {
      throw pipeline::SourceOpenError("cannot duplicate standard input: " + std::string(std::strerror(errno)));
    }
    file_ = gzdopen(fd, "rb");
    if (file_ == nullptr) {
      ::close(fd);
    }
  } else {
    file_ = gzopen(path_.c_str(), "rb");
  }

  if (file_ == nullptr) {
    const int err = errno;
    BOOST_LOG_TRIVIAL(error) << "FileLineSource: Failed to open " << path_;
    throw pipeline::SourceOpenError(path_ + ": " + (err != 0 ? std::strerror(err) : "out of memory"));
  }

  gzbuffer(file_, READ_BUFFER_SIZE);
  // Must follow gzbuffer(): gzdirect() performs the first read to sniff the header
  compressed_ = gzdirect(file_) == 0;
  BOOST_LOG_TRIVIAL(info) << "FileLineSource: Opened " << path_
                          << (compressed_ ? " (gzip)" : " (plain)");
}

FileLineSource::~FileLineSource() {
  close();
}


//==============================================
// LINE SOURCE INTERFACE
//==============================================

ReadStatus FileLineSource::read_line(std::string& line) {
  line.clear();
  if (file_ == nullptr) {
    last_error_ = "read from closed source";
    return ReadStatus::ERROR;
  }

  // Lines are split on '\n' only; any other byte, NUL included, is line content
  while (true) {
    if (buffer_pos_ == buffer_end_) {
      const int got = gzread(file_, buffer_.data(), static_cast<unsigned int>(buffer_.size()));
      int errnum = Z_OK;
      gzerror(file_, &errnum);
      if (got < 0 || (got == 0 && errnum != Z_OK)) {
        last_error_ = describe_gz_error();
        BOOST_LOG_TRIVIAL(error) << "FileLineSource: Read failed on " << path_ << ": " << last_error_;
        return ReadStatus::ERROR;
      }
      if (got == 0) {
        return line.empty() ? ReadStatus::END_OF_STREAM : ReadStatus::LINE;
      }
      buffer_pos_ = 0;
      buffer_end_ = static_cast<std::size_t>(got);
    }

    const char* begin = buffer_.data() + buffer_pos_;
    const std::size_t available = buffer_end_ - buffer_pos_;
    const void* newline = std::memchr(begin, '\n', available);
    if (newline != nullptr) {
      const std::size_t length = static_cast<const char*>(newline) - begin + 1;
      line.append(begin, length);
      buffer_pos_ += length;
      return ReadStatus::LINE;
    }
    line.append(begin, available);
    buffer_pos_ = buffer_end_;
  }
}

void FileLineSource::close() {
  if (file_ == nullptr) {
    return;
  }
  int result = gzclose(file_);
  file_ = nullptr;
  if (result != Z_OK) {
    BOOST_LOG_TRIVIAL(warning) << "FileLineSource: Close of " << path_ << " reported zlib error " << result;
  } else {
    BOOST_LOG_TRIVIAL(debug) << "FileLineSource: Closed " << path_;
  }
}


//==============================================
// ERROR SUPPORT
//==============================================

std::string FileLineSource::describe_gz_error() {
  int errnum = Z_OK;
  const char* message = gzerror(file_, &errnum);
  if (errnum == Z_ERRNO) {
    return std::strerror(errno);
  }
  return message != nullptr ? message : "unknown zlib error";
}

} // namespace source
} // namespace chunkline
