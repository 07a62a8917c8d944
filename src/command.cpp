/**
 * @file command.cpp
 * @brief Command set helpers
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "probelink/command.hpp"

namespace probe
{
namespace link
{

namespace
{

struct OpcodeOf
{
  Opcode operator()(const Halt&) const { return Opcode::HALT; }
  Opcode operator()(const Resume&) const { return Opcode::RESUME; }
  Opcode operator()(const ReadBytes&) const { return Opcode::READ_BYTES; }
  Opcode operator()(const ReadWord&) const { return Opcode::READ_WORD; }
  Opcode operator()(const ReadWords&) const { return Opcode::READ_WORDS; }
  Opcode operator()(const Write&) const { return Opcode::WRITE; }
};

struct ReplyPayloadSize
{
  size_t operator()(const Halt&) const { return 0; }
  size_t operator()(const Resume&) const { return 0; }
  size_t operator()(const ReadBytes& c) const { return c.length; }
  size_t operator()(const ReadWord&) const { return 4; }
  size_t operator()(const ReadWords& c) const { return static_cast<size_t>(c.count) * 4; }
  size_t operator()(const Write&) const { return 0; }
};

}  // namespace

Opcode opcode_of(const Command& cmd)
{
  return std::visit(OpcodeOf{}, cmd);
}

size_t reply_payload_size(const Command& cmd)
{
  return std::visit(ReplyPayloadSize{}, cmd);
}

size_t expected_reply_size(const Command& cmd)
{
  return REPLY_BASE_SIZE + reply_payload_size(cmd);
}

}  // namespace link
}  // namespace probe
