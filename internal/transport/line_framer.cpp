#include "line_framer.hpp"

#include "internal/observability/logging.hpp"

namespace meshdispatch::transport {

LineFramer::LineFramer(std::size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {
}

std::vector<std::string> LineFramer::Feed(const char* data, std::size_t size) {
  std::vector<std::string> frames;

  for (std::size_t i = 0; i < size; ++i) {
    const char c = data[i];

    if (c == '\n') {
      if (!discarding_ && !partial_.empty()) {
        frames.push_back(std::move(partial_));
      }
      partial_.clear();
      discarding_ = false;
      continue;
    }

    if (c == '\r' || discarding_) {
      continue;
    }

    if (partial_.size() >= max_frame_bytes_) {
      ++discarded_;
      MESHDISPATCH_LOG_WARN("discarding oversized radio frame",
                            {observability::IntField("max_frame_bytes", static_cast<std::int64_t>(max_frame_bytes_))});
      partial_.clear();
      discarding_ = true;
      continue;
    }

    partial_.push_back(c);
  }

  return frames;
}

void LineFramer::Reset() {
  partial_.clear();
  discarding_ = false;
}

} // namespace meshdispatch::transport
