/**
 * @file transport.hpp
 * @brief Byte channel consumed by a Session
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "probelink/protocol.hpp"

namespace probe
{
namespace link
{

/**
 * @brief Opened duplex byte channel to the probe
 *
 * All calls block. Implementations report a read window that elapses
 * without enough data as ErrorCode::TIMEOUT and any other channel failure
 * as ErrorCode::TRANSPORT_ERROR.
 */
class Transport
{
 public:
  virtual ~Transport() = default;

  /**
   * @brief Write all @p len bytes
   */
  virtual ErrorCode write(const uint8_t* data, size_t len) = 0;

  /**
   * @brief Block until written bytes have left the host
   */
  virtual ErrorCode flush() = 0;

  /**
   * @brief Best-effort read
   *
   * Waits up to the configured timeout for the first byte, then returns
   * whatever is available (at most @p capacity bytes).
   *
   * @param buf      Destination buffer
   * @param capacity Size of @p buf
   * @param received Number of bytes stored in @p buf
   * @return OK if at least one byte arrived, TIMEOUT if none did
   */
  virtual ErrorCode read(uint8_t* buf, size_t capacity, size_t& received) = 0;

  /**
   * @brief Read exactly @p len bytes
   *
   * @param buf      Destination buffer
   * @param len      Number of bytes wanted
   * @param received Number of bytes stored in @p buf, also on TIMEOUT
   * @return OK when @p len bytes arrived, TIMEOUT when the window elapsed first
   */
  virtual ErrorCode read_exact(uint8_t* buf, size_t len, size_t& received) = 0;

  /**
   * @brief Set the read window used by read() and read_exact()
   */
  virtual ErrorCode set_timeout(uint32_t timeout_ms) = 0;

  /**
   * @brief Drop received bytes nobody has read yet
   *
   * Called before every request so a late or partial reply to an earlier
   * request cannot be taken for the next one. Must not block.
   */
  virtual ErrorCode discard_input() = 0;
};

}  // namespace link
}  // namespace probe
