/**
 * @file protocol.cpp
 * @brief Error code and opcode descriptions
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "probelink/protocol.hpp"

namespace probe
{
namespace link
{

const char* error_message(ErrorCode code)
{
  switch (code)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "probelink/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

const char* opcode_name(Opcode op)
{
  switch (op)
  {
    case Opcode::HALT:
      return "HALT";
    case Opcode::RESUME:
      return "RESUME";
    case Opcode::READ_WORD:
      return "READ_WORD";
    case Opcode::WRITE:
      return "WRITE";
    case Opcode::READ_BYTES:
      return "READ_BYTES";
    case Opcode::READ_WORDS:
      return "READ_WORDS";
  }
  return "UNKNOWN";
}

}  // namespace link
}  // namespace probe
