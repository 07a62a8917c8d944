/**
 * @file command.hpp
 * @brief Probe command set
 *
 * Closed set of requests the host can issue. Each alternative carries only
 * the fields its opcode needs; the frame codec dispatches over all of them.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "probelink/protocol.hpp"

namespace probe
{
namespace link
{

/// Halt the target core
struct Halt
{
};

/// Resume the target core
struct Resume
{
};

/// Read @c length bytes starting at @c address
struct ReadBytes
{
  uint32_t address;
  uint32_t length;
};

/// Read one 32-bit word at @c address
struct ReadWord
{
  uint32_t address;
};

/// Read @c count consecutive 32-bit words starting at @c address
struct ReadWords
{
  uint32_t address;
  uint32_t count;
};

/// Write @c data starting at @c address
struct Write
{
  uint32_t address;
  std::vector<uint8_t> data;
};

/**
 * @brief One probe request
 */
using Command = std::variant<Halt, Resume, ReadBytes, ReadWord, ReadWords, Write>;

/**
 * @brief Opcode used to send a command
 */
Opcode opcode_of(const Command& cmd);

/**
 * @brief Number of data bytes following the ACK in a successful reply
 *
 * 0 for Halt, Resume and Write.
 */
size_t reply_payload_size(const Command& cmd);

/**
 * @brief Total size of a successful reply frame
 *
 * @return REPLY_BASE_SIZE + reply_payload_size(cmd)
 */
size_t expected_reply_size(const Command& cmd);

}  // namespace link
}  // namespace probe
