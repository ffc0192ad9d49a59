#pragma once

#include <cstdint>
#include <string>

#include "internal/transport/stream_link.hpp"

namespace meshdispatch::transport {

// Radio reached through a TCP bridge (gateway node with a network API).
class TcpLink final : public StreamLink {
 public:
  TcpLink(std::string host, std::uint16_t port, std::chrono::milliseconds reconnect_interval, std::chrono::milliseconds write_timeout,
          std::size_t max_frame_bytes);
  ~TcpLink() override;

 protected:
  int     OpenLink() override;
  ssize_t WriteSome(int fd, const char* data, std::size_t size) override;

 private:
  std::string   host_;
  std::uint16_t port_;
};

} // namespace meshdispatch::transport
