#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace meshdispatch::transport {

/*
  Splits a byte stream into newline-delimited frames.

  A line longer than max_frame_bytes is discarded up to its terminating
  newline. Carriage returns and blank lines are dropped.
*/
class LineFramer {
 public:
  explicit LineFramer(std::size_t max_frame_bytes);

  std::vector<std::string> Feed(const char* data, std::size_t size);

  // Drop any partial line (connection reset).
  void Reset();

  std::uint64_t Discarded() const {
    return discarded_;
  }

 private:
  std::size_t   max_frame_bytes_;
  std::string   partial_;
  bool          discarding_ = false;
  std::uint64_t discarded_  = 0;
};

} // namespace meshdispatch::transport
