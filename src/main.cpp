#include "logger/logger.hpp"
#include "pipeline/pipeline.hpp"
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <unordered_set>

using chunkline::pipeline::Pipeline;
using chunkline::pipeline::PipelineConfig;
using chunkline::pipeline::TransformFn;
using chunkline::pipeline::TransformOutcome;

struct ProgramOptions {
  std::string input;
  PipelineConfig config;
  bool skip_comments{false};
  std::uint64_t head{0};
  std::string log_file;
  boost::log::trivial::severity_level log_level{boost::log::trivial::warning};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options] <file|->\n"
        << "Options:\n"
        << "  -j, --jobs N         Chunks transformed concurrently (default: CPU count)\n"
        << "  -c, --chunk-size N   Lines per chunk (default: " << PipelineConfig::DEFAULT_CHUNK_SIZE << ")\n"
        << "  -s, --skip-comments  Drop blank lines and lines starting with '#'\n"
        << "  -n, --head N         Stop after printing N lines\n"
        << "  -l, --log-file PATH  Write the log to PATH instead of stderr\n"
        << "  -v, --verbose        Debug logging, same as --log-level debug\n"
        << "      --log-level L    trace, debug, info, warning (default), error or fatal\n"
        << "Example: " << program_name << " -j 4 -c 1000 data.tsv.gz\n";
}

bool parse_count(const std::string& value, std::uint64_t& out) {
  try {
    std::size_t consumed = 0;
    unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      return false;
    }
    out = parsed;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "-j", "--jobs", "-c", "--chunk-size", "-n", "--head", "-l", "--log-file", "--log-level"
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-s" || flag == "--skip-comments") {
      options.skip_comments = true;
      continue;
    }
    if (flag == "-v" || flag == "--verbose") {
      options.log_level = boost::log::trivial::debug;
      continue;
    }
    if (value_flags.count(flag) == 0) {
      if (flag.size() > 1 && flag[0] == '-') {
        std::cerr << "Error: Unknown argument: " << flag << '\n';
        print_usage(argv[0]);
        return options;
      }
      if (!options.input.empty()) {
        std::cerr << "Error: Only one input file is accepted\n";
        print_usage(argv[0]);
        return options;
      }
      options.input = flag;
      continue;
    }

    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-l" || flag == "--log-file") {
      options.log_file = value;
      continue;
    }
    if (flag == "--log-level") {
      if (!chunkline::logging::parse_log_level(value, options.log_level)) {
        std::cerr << "Error: Unknown log level: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
      continue;
    }

    std::uint64_t count = 0;
    if (!parse_count(value, count)) {
      std::cerr << "Error: Invalid number for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (flag == "-j" || flag == "--jobs") {
      options.config.buffer_size = static_cast<std::size_t>(count);
    } else if (flag == "-c" || flag == "--chunk-size") {
      options.config.chunk_size = static_cast<std::size_t>(count);
    } else {
      options.head = count;
    }
  }

  if (options.input.empty()) {
    std::cerr << "Error: An input file is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

TransformFn<std::string> make_transform(bool skip_comments) {
  return [skip_comments](const std::string& line) {
    TransformOutcome<std::string> trimmed = chunkline::pipeline::trim_newline(line);
    if (skip_comments) {
      const std::string& text = trimmed.value();
      if (text.empty() || text[0] == '#') {
        return TransformOutcome<std::string>::skip();
      }
    }
    return trimmed;
  };
}

// Prints every line in order. With a head limit, cancels once enough lines are out
// and keeps polling until the pipeline reports it is closed.
bool run_pipeline(const ProgramOptions& options) {
  try {
    auto pipeline = Pipeline<std::string>::open(options.input, options.config, make_transform(options.skip_comments));

    std::uint64_t printed = 0;
    bool cancelled = false;
    Pipeline<std::string>::Chunk chunk;

    while (true) {
      const auto status = pipeline->try_next(chunk);
      if (status == Pipeline<std::string>::PollStatus::CLOSED) {
        break;
      }
      if (status == Pipeline<std::string>::PollStatus::EMPTY) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        continue;
      }

      for (const std::string& line : chunk.data) {
        if (cancelled) {
          break;
        }
        std::cout << line << '\n';
        if (options.head > 0 && ++printed >= options.head) {
          pipeline->cancel();
          cancelled = true;
        }
      }

      if (chunk.error && !(cancelled && chunk.error->is_cancellation())) {
        std::cout.flush();
        std::cerr << "Error: " << chunk.error->to_string() << '\n';
        return false;
      }
    }

    std::cout.flush();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  try {
    if (options.log_file.empty()) {
      chunkline::logging::init_console_logging(options.log_level);
    } else {
      chunkline::logging::init_logging(options.log_file, options.log_level);
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to set up logging: " << e.what() << '\n';
    return 1;
  }

  return run_pipeline(options) ? 0 : 1;
}
