#include "transport_factory.hpp"

#include <stdexcept>

#include "internal/transport/serial_link.hpp"
#include "internal/transport/tcp_link.hpp"
#include "internal/util/time.hpp"

namespace meshdispatch::transport {

std::shared_ptr<Transport> BuildTransport(const meshdispatch::runtime::config::RadioConfig& config) {
  const auto reconnect = util::ToMillis(config.reconnect_interval(), std::chrono::seconds(5));
  const auto write_timeout = util::ToMillis(config.write_timeout(), std::chrono::seconds(2));
  const auto max_frame = config.max_frame_bytes() > 0 ? config.max_frame_bytes() : 4096;

  if (config.has_tcp()) {
    return std::make_shared<TcpLink>(config.tcp().host(), static_cast<std::uint16_t>(config.tcp().port()), reconnect, write_timeout, max_frame);
  }
  if (config.has_serial()) {
    return std::make_shared<SerialLink>(config.serial().device_path(), config.serial().baud(), reconnect, write_timeout, max_frame);
  }
  throw std::runtime_error("radio link not configured (set radio.tcp or radio.serial)");
}

} // namespace meshdispatch::transport
