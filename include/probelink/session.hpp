/**
 * @file session.hpp
 * @brief probelink device session
 *
 * Operation-level access to the probe: every call is one request frame and
 * at most one reply frame over an exclusively owned Transport.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "probelink/command.hpp"
#include "probelink/protocol.hpp"
#include "probelink/target.hpp"
#include "probelink/transport.hpp"

namespace probe
{
namespace link
{

/**
 * @brief Timing policy of a Session
 *
 * Delays give the probe firmware time to turn a request around. Zero is a
 * valid value for every field; control_reply_capacity is raised to
 * REPLY_BASE_SIZE when smaller.
 */
struct SessionConfig
{
  uint32_t settle_delay_ms = 10;            ///< Pause between request and reply read
  uint32_t control_reply_timeout_ms = 100;  ///< Window for optional control replies
  uint32_t read_timeout_ms = 1000;          ///< Window for mandatory read replies
  uint32_t register_select_delay_ms = 10;   ///< Pause between DCRSR write and DCRDR read
  size_t control_reply_capacity = 256;      ///< Scratch size for control replies
};

/**
 * @brief Host side of the probe protocol
 *
 * Not thread-safe. Share one Session between callers through SharedSession.
 *
 * Example usage:
 * @code
 * SerialConfig serial;
 * serial.device = "/dev/ttyACM0";
 *
 * std::unique_ptr<SerialTransport> port(new SerialTransport());
 * if (port->open(serial) != ErrorCode::OK) { ... }
 *
 * Session session(std::move(port));
 * session.halt();
 *
 * uint32_t pc = 0;
 * if (session.read_pc(pc) == ErrorCode::OK) { ... }
 *
 * session.resume();
 * @endcode
 */
class Session
{
 public:
  /**
   * @brief Construct Session instance
   *
   * @param transport Opened byte channel, owned by the session
   * @param config    Timing policy
   * @param profile   Target description (debug register addresses)
   */
  explicit Session(std::unique_ptr<Transport> transport, SessionConfig config = SessionConfig(),
                   TargetProfile profile = mspm0g3507_profile());

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /**
   * @brief Halt the target core
   *
   * Fire-and-forget: a reply is read and discarded, a missing or partial
   * reply is not an error.
   *
   * @return OK, DEVICE_REJECTED if the probe answered with its error
   *         status, or a transport failure
   */
  ErrorCode halt();

  /**
   * @brief Resume the target core
   *
   * Same reply policy as halt().
   */
  ErrorCode resume();

  /**
   * @brief Write one 32-bit word, big-endian on the wire
   *
   * Same reply policy as halt().
   */
  ErrorCode write_word(uint32_t address, uint32_t value);

  /**
   * @brief Write raw bytes
   *
   * Same reply policy as halt().
   *
   * @return PAYLOAD_TOO_LARGE if @p data exceeds MAX_PAYLOAD_SIZE
   */
  ErrorCode write_bytes(uint32_t address, const std::vector<uint8_t>& data);

  /**
   * @brief Read @p length bytes
   *
   * @param address Start address
   * @param length  Byte count, at most MAX_PAYLOAD_SIZE
   * @param out     Receives exactly @p length bytes on success
   * @return OK, PAYLOAD_TOO_LARGE, TIMEOUT, SHORT_REPLY, DEVICE_REJECTED,
   *         UNEXPECTED_RESPONSE, CHECKSUM_MISMATCH, INVALID_FRAME or a
   *         transport failure
   */
  ErrorCode read_bytes(uint32_t address, uint32_t length, std::vector<uint8_t>& out);

  /**
   * @brief Read one 32-bit word, big-endian on the wire
   */
  ErrorCode read_word(uint32_t address, uint32_t& value);

  /**
   * @brief Read @p count consecutive 32-bit words
   */
  ErrorCode read_words(uint32_t address, uint32_t count, std::vector<uint32_t>& out);

  /**
   * @brief Read a core register through DCRSR / DCRDR
   *
   * @param index Register number (0-15 general purpose, 15 = PC)
   * @param value Receives the register content
   * @return INVALID_ARGUMENT if @p index does not fit the REGSEL field
   */
  ErrorCode read_register(uint8_t index, uint32_t& value);

  /**
   * @brief Read the program counter
   */
  ErrorCode read_pc(uint32_t& value);

  /**
   * @brief Set a hardware breakpoint
   *
   * The probe firmware offers no breakpoint command.
   *
   * @return Always NOT_IMPLEMENTED
   */
  ErrorCode set_breakpoint(uint32_t address);

  /**
   * @brief Swap in a new channel after the old one dropped
   *
   * @param transport New channel, or nullptr to close the session
   */
  void replace_transport(std::unique_ptr<Transport> transport);

  /**
   * @brief Check whether a transport is attached
   */
  bool is_open() const
  {
    return transport_ != nullptr;
  }

  const SessionConfig& config() const
  {
    return config_;
  }

  const TargetProfile& profile() const
  {
    return profile_;
  }

 private:
  /**
   * @brief Encode @p cmd, write and flush it
   */
  ErrorCode send(const Command& cmd);

  /**
   * @brief Round trip with discard-on-timeout reply policy
   */
  ErrorCode control(const Command& cmd);

  /**
   * @brief Collect one reply frame with Transport::read()
   *
   * Reads until the length field says the frame is complete, the bytes
   * are evidently not a frame, or @p timeout_ms has elapsed.
   *
   * @param buf      Scratch buffer, grown to the frame size when needed
   * @param received Number of bytes collected, also on TIMEOUT
   */
  ErrorCode read_frame(uint32_t timeout_ms, std::vector<uint8_t>& buf, size_t& received);

  /**
   * @brief Round trip with mandatory reply
   *
   * @param payload Receives the reply data
   */
  ErrorCode query(const Command& cmd, std::vector<uint8_t>& payload);

  void delay(uint32_t ms) const;

  std::unique_ptr<Transport> transport_;  ///< Exclusively owned channel
  SessionConfig config_;                  ///< Timing policy
  TargetProfile profile_;                 ///< Target description
};

}  // namespace link
}  // namespace probe
