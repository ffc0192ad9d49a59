#pragma once

#include <cstdint>
#include <string>

#include "internal/transport/stream_link.hpp"

namespace meshdispatch::transport {

// Radio attached over a serial TTY, raw 8N1.
class SerialLink final : public StreamLink {
 public:
  SerialLink(std::string device_path, std::uint32_t baud, std::chrono::milliseconds reconnect_interval,
             std::chrono::milliseconds write_timeout, std::size_t max_frame_bytes);
  ~SerialLink() override;

 protected:
  int OpenLink() override;

 private:
  std::string   device_path_;
  std::uint32_t baud_;
};

} // namespace meshdispatch::transport
