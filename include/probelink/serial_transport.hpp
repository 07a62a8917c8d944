/**
 * @file serial_transport.hpp
 * @brief POSIX serial port Transport
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <termios.h>

#include <cstdint>
#include <string>

#include "probelink/transport.hpp"

namespace probe
{
namespace link
{

/**
 * @brief Serial port settings
 */
struct SerialConfig
{
  std::string device;            ///< e.g. "/dev/ttyACM0"
  uint32_t baud_rate = 115200;   ///< One of the standard POSIX rates
  uint32_t timeout_ms = 1000;    ///< Initial read window
};

/**
 * @brief Raw 8N1 serial line without flow control
 *
 * Finding the right device node (for example by USB vendor/product id) is
 * left to the caller.
 */
class SerialTransport : public Transport
{
 public:
  SerialTransport();
  ~SerialTransport() override;

  SerialTransport(const SerialTransport&) = delete;
  SerialTransport& operator=(const SerialTransport&) = delete;

  /**
   * @brief Open and configure the port
   *
   * @return OK, INVALID_ARGUMENT for an unsupported baud rate or when
   *         already open, TRANSPORT_ERROR if the device cannot be opened
   */
  ErrorCode open(const SerialConfig& config);

  /**
   * @brief Restore the original line settings and close the port
   */
  void close();

  bool is_open() const
  {
    return fd_ >= 0;
  }

  ErrorCode write(const uint8_t* data, size_t len) override;
  ErrorCode flush() override;
  ErrorCode read(uint8_t* buf, size_t capacity, size_t& received) override;
  ErrorCode read_exact(uint8_t* buf, size_t len, size_t& received) override;
  ErrorCode set_timeout(uint32_t timeout_ms) override;
  ErrorCode discard_input() override;

 private:
  /**
   * @brief Wait until the port is readable
   *
   * @return OK, TIMEOUT or TRANSPORT_ERROR
   */
  ErrorCode wait_readable(int timeout_ms);

  int fd_;
  std::string device_;
  uint32_t timeout_ms_;
  termios saved_;
  bool saved_valid_;
};

}  // namespace link
}  // namespace probe
