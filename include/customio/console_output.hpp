#pragma once

#include <cstddef>
#include <cstdio>
#include <iostream>
#include <ostream>
#include <streambuf>
#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace customio {

// Command results go to out(); diagnostics go to the error stream, filtered
// by verbosity (0 silent .. 5 trace).
class ConsoleOutput {
  class NullBuffer : public std::streambuf {
  protected:
    int overflow(int c) override { return c; }
  };

  std::size_t verbosity_;
  std::ostream &out_;
  std::ostream &err_;
  bool colors_;
  NullBuffer null_buffer_;
  std::ostream null_stream_{&null_buffer_};

  std::ostream &at_level(std::size_t level, const char *label,
                         const char *color) {
    if (verbosity_ < level) {
      return null_stream_;
    }
    if (colors_) {
      err_ << color << label << "\033[0m ";
    } else {
      err_ << label << " ";
    }
    return err_;
  }

public:
  explicit ConsoleOutput(std::size_t verbosity, std::ostream &out = std::cout,
                         std::ostream &err = std::cerr)
      : verbosity_(verbosity), out_(out), err_(err),
        colors_(&err == &std::cerr && stderr_is_tty()) {}

  std::size_t verbosity() const { return verbosity_; }

  std::ostream &out() { return out_; }
  std::ostream &error() { return at_level(1, "error:", "\033[31m"); }
  std::ostream &warning() { return at_level(2, "warning:", "\033[33m"); }
  std::ostream &info() { return at_level(3, "info:", "\033[32m"); }
  std::ostream &debug() { return at_level(4, "debug:", "\033[36m"); }

private:
  static bool stderr_is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stderr)) != 0;
#endif
  }
};

} // namespace customio
