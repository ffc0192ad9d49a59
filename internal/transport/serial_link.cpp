#include "serial_link.hpp"

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/util/errors.hpp"

namespace meshdispatch::transport {

namespace {

speed_t ToSpeed(std::uint32_t baud) {
  switch (baud) {
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 230400:
      return B230400;
    case 460800:
      return B460800;
    case 921600:
      return B921600;
    default:
      return B115200;
  }
}

// Raw 8N1, no flow control. VMIN/VTIME zero: the reader polls.
bool SetRaw(int fd, speed_t speed) {
  termios tio{};
  if (tcgetattr(fd, &tio) != 0) return false;

  cfmakeraw(&tio);
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);

  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cc[VMIN]  = 0;
  tio.c_cc[VTIME] = 0;

  if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
  tcflush(fd, TCIOFLUSH);
  return true;
}

} // namespace

SerialLink::SerialLink(std::string device_path, std::uint32_t baud, std::chrono::milliseconds reconnect_interval,
                       std::chrono::milliseconds write_timeout, std::size_t max_frame_bytes)
    : StreamLink("serial:" + device_path, reconnect_interval, write_timeout, max_frame_bytes), device_path_(std::move(device_path)), baud_(baud) {
}

SerialLink::~SerialLink() {
  Stop();
}

int SerialLink::OpenLink() {
  const int fd = ::open(device_path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    throw util::TransportError("open " + device_path_ + ": " + std::strerror(errno));
  }

  if (!SetRaw(fd, ToSpeed(baud_))) {
    const std::string error = std::strerror(errno);
    ::close(fd);
    throw util::TransportError("configure " + device_path_ + ": " + error);
  }

  // stays O_NONBLOCK; reads and writes are driven by poll()
  return fd;
}

} // namespace meshdispatch::transport
