#pragma once

#include <iostream>
#include <ostream>
#include <streambuf>

namespace tradectl {

// -----------------------------------------------------------------------------
// StdoutLogRedirect
// -----------------------------------------------------------------------------
//
// @brief  Sends everything written to std::cout to std::cerr's buffer for
//         the lifetime of the object.
//
// @details
// Components log informational lines to std::cout. tradectl_sim prints its
// final summary as JSON on stdout, so while a replay runs the log lines are
// moved to stderr and the summary is written through out(), which still
// targets the original stdout buffer.
//
// Ownership:
//   Restores std::cout's buffer on destruction. Not copyable; only one
//   instance should be alive at a time.
// -----------------------------------------------------------------------------
class StdoutLogRedirect {
 public:
  StdoutLogRedirect()
      : stdout_buffer_(std::cout.rdbuf(std::cerr.rdbuf())),
        out_(stdout_buffer_) {}

  ~StdoutLogRedirect() {
    out_.flush();
    std::cout.rdbuf(stdout_buffer_);
  }

  StdoutLogRedirect(const StdoutLogRedirect&) = delete;
  StdoutLogRedirect& operator=(const StdoutLogRedirect&) = delete;

  // Stream on the real stdout.
  std::ostream& out() { return out_; }

 private:
  std::streambuf* stdout_buffer_;
  std::ostream out_;
};

}  // namespace tradectl
