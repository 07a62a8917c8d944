/**
 * @file serial_transport.cpp
 * @brief POSIX serial port Transport implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "probelink/serial_transport.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

#include "probelink/log.hpp"

namespace probe
{
namespace link
{

namespace
{

bool to_speed(uint32_t baud_rate, speed_t& speed)
{
  switch (baud_rate)
  {
    case 9600:
      speed = B9600;
      return true;
    case 19200:
      speed = B19200;
      return true;
    case 38400:
      speed = B38400;
      return true;
    case 57600:
      speed = B57600;
      return true;
    case 115200:
      speed = B115200;
      return true;
    case 230400:
      speed = B230400;
      return true;
    case 460800:
      speed = B460800;
      return true;
    case 921600:
      speed = B921600;
      return true;
    default:
      return false;
  }
}

}  // namespace

SerialTransport::SerialTransport()
    : fd_(-1), device_(), timeout_ms_(1000), saved_(), saved_valid_(false)
{
}

SerialTransport::~SerialTransport()
{
  close();
}

ErrorCode SerialTransport::open(const SerialConfig& config)
{
  if (fd_ >= 0)
  {
    return ErrorCode::INVALID_ARGUMENT;
  }

  speed_t speed;
  if (!to_speed(config.baud_rate, speed))
  {
    PROBELINK_LOG_E("unsupported baud rate %u", config.baud_rate);
    return ErrorCode::INVALID_ARGUMENT;
  }

  const int fd = ::open(config.device.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
  if (fd < 0)
  {
    PROBELINK_LOG_E("open(%s): %s", config.device.c_str(), std::strerror(errno));
    return ErrorCode::TRANSPORT_ERROR;
  }

  termios tio;
  if (tcgetattr(fd, &tio) != 0)
  {
    PROBELINK_LOG_E("tcgetattr(%s): %s", config.device.c_str(), std::strerror(errno));
    ::close(fd);
    return ErrorCode::TRANSPORT_ERROR;
  }
  saved_ = tio;
  saved_valid_ = true;

  cfmakeraw(&tio);
  tio.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
  tio.c_cflag |= CS8 | CLOCAL | CREAD;
  tio.c_iflag &= ~(IXON | IXOFF | IXANY);
  // Timeouts are handled with poll()
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);

  if (tcsetattr(fd, TCSANOW, &tio) != 0)
  {
    PROBELINK_LOG_E("tcsetattr(%s): %s", config.device.c_str(), std::strerror(errno));
    ::close(fd);
    saved_valid_ = false;
    return ErrorCode::TRANSPORT_ERROR;
  }
  tcflush(fd, TCIOFLUSH);

  fd_ = fd;
  device_ = config.device;
  timeout_ms_ = config.timeout_ms;

  PROBELINK_LOG_I("opened %s at %u baud", device_.c_str(), config.baud_rate);
  return ErrorCode::OK;
}

void SerialTransport::close()
{
  if (fd_ < 0)
  {
    return;
  }

  if (saved_valid_)
  {
    tcsetattr(fd_, TCSANOW, &saved_);
    saved_valid_ = false;
  }
  ::close(fd_);
  fd_ = -1;
  PROBELINK_LOG_D("closed %s", device_.c_str());
  device_.clear();
}

ErrorCode SerialTransport::write(const uint8_t* data, size_t len)
{
  if (fd_ < 0)
  {
    return ErrorCode::NOT_OPEN;
  }

  size_t written = 0;
  while (written < len)
  {
    const ssize_t n = ::write(fd_, data + written, len - written);
    if (n < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }
      PROBELINK_LOG_E("write(%s): %s", device_.c_str(), std::strerror(errno));
      return ErrorCode::TRANSPORT_ERROR;
    }
    written += static_cast<size_t>(n);
  }

  return ErrorCode::OK;
}

ErrorCode SerialTransport::flush()
{
  if (fd_ < 0)
  {
    return ErrorCode::NOT_OPEN;
  }

  if (tcdrain(fd_) != 0)
  {
    PROBELINK_LOG_E("tcdrain(%s): %s", device_.c_str(), std::strerror(errno));
    return ErrorCode::TRANSPORT_ERROR;
  }

  return ErrorCode::OK;
}

ErrorCode SerialTransport::read(uint8_t* buf, size_t capacity, size_t& received)
{
  received = 0;
  if (fd_ < 0)
  {
    return ErrorCode::NOT_OPEN;
  }

  if (capacity == 0)
  {
    return ErrorCode::INVALID_ARGUMENT;
  }

  for (;;)
  {
    const ErrorCode err = wait_readable(static_cast<int>(timeout_ms_));
    if (err != ErrorCode::OK)
    {
      return err;
    }

    const ssize_t n = ::read(fd_, buf, capacity);
    if (n < 0)
    {
      if (errno == EINTR || errno == EAGAIN)
      {
        continue;
      }
      PROBELINK_LOG_E("read(%s): %s", device_.c_str(), std::strerror(errno));
      return ErrorCode::TRANSPORT_ERROR;
    }
    if (n == 0)
    {
      PROBELINK_LOG_E("read(%s): device disconnected", device_.c_str());
      return ErrorCode::TRANSPORT_ERROR;
    }

    received = static_cast<size_t>(n);
    return ErrorCode::OK;
  }
}

ErrorCode SerialTransport::read_exact(uint8_t* buf, size_t len, size_t& received)
{
  received = 0;
  if (fd_ < 0)
  {
    return ErrorCode::NOT_OPEN;
  }

  using Clock = std::chrono::steady_clock;
  const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_ms_);

  while (received < len)
  {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    if (remaining <= 0)
    {
      return ErrorCode::TIMEOUT;
    }

    const ErrorCode err = wait_readable(static_cast<int>(remaining));
    if (err != ErrorCode::OK)
    {
      return err;
    }

    const ssize_t n = ::read(fd_, buf + received, len - received);
    if (n < 0)
    {
      if (errno == EINTR || errno == EAGAIN)
      {
        continue;
      }
      PROBELINK_LOG_E("read(%s): %s", device_.c_str(), std::strerror(errno));
      return ErrorCode::TRANSPORT_ERROR;
    }
    if (n == 0)
    {
      PROBELINK_LOG_E("read(%s): device disconnected", device_.c_str());
      return ErrorCode::TRANSPORT_ERROR;
    }
    received += static_cast<size_t>(n);
  }

  return ErrorCode::OK;
}

ErrorCode SerialTransport::set_timeout(uint32_t timeout_ms)
{
  timeout_ms_ = timeout_ms;
  return ErrorCode::OK;
}

ErrorCode SerialTransport::discard_input()
{
  if (fd_ < 0)
  {
    return ErrorCode::NOT_OPEN;
  }

  if (tcflush(fd_, TCIFLUSH) != 0)
  {
    PROBELINK_LOG_E("tcflush(%s): %s", device_.c_str(), std::strerror(errno));
    return ErrorCode::TRANSPORT_ERROR;
  }

  return ErrorCode::OK;
}

ErrorCode SerialTransport::wait_readable(int timeout_ms)
{
  pollfd pfd;
  pfd.fd = fd_;
  pfd.events = POLLIN;
  pfd.revents = 0;

  for (;;)
  {
    const int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc > 0)
    {
      if (pfd.revents & (POLLERR | POLLNVAL))
      {
        return ErrorCode::TRANSPORT_ERROR;
      }
      // POLLHUP with pending data still reads; without data read() returns 0
      return ErrorCode::OK;
    }
    if (rc == 0)
    {
      return ErrorCode::TIMEOUT;
    }
    if (errno != EINTR)
    {
      PROBELINK_LOG_E("poll(%s): %s", device_.c_str(), std::strerror(errno));
      return ErrorCode::TRANSPORT_ERROR;
    }
  }
}

}  // namespace link
}  // namespace probe
