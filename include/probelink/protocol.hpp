/**
 * @file protocol.hpp
 * @brief probelink wire protocol definitions
 *
 * Framed command protocol spoken between the host and the debug probe that
 * drives the Cortex-M target.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace probe
{
namespace link
{

/* ========================================================================= */
/* Frame format constants                                                    */
/* ========================================================================= */

/**
 * @brief Frame header bytes
 *
 * All frames must begin with HEADER_0, HEADER_1.
 */
constexpr uint8_t HEADER_0 = 0xFF;
constexpr uint8_t HEADER_1 = 0xF9;

/**
 * @brief Frame footer bytes
 *
 * All frames must end with FOOTER_0, FOOTER_1.
 */
constexpr uint8_t FOOTER_0 = 0xF5;
constexpr uint8_t FOOTER_1 = 0xE7;

/**
 * @brief Maximum payload size in bytes
 *
 * Upper bound for ReadBytes length and Write data.
 */
constexpr size_t MAX_PAYLOAD_SIZE = 4096;

/**
 * @brief Frame checksum polynomial
 *
 * Uses polynomial 0x07 (x^8 + x^2 + x + 1)
 */
constexpr uint8_t CRC8_POLY = 0x07;

/**
 * @brief Block checksum polynomial (reflected CRC-32/IEEE)
 */
constexpr uint32_t CRC32_POLY = 0xEDB88320;

/**
 * @brief Block checksum seed
 */
constexpr uint32_t CRC32_INIT = 0xFFFFFFFF;

/**
 * @brief Bytes outside the counted span
 *
 * HEADER(2) + LEN(2) + FOOTER(2)
 */
constexpr size_t FRAME_OVERHEAD = 6;

/**
 * @brief Offset of the opcode byte
 */
constexpr size_t OPCODE_OFFSET = 4;

/**
 * @brief Offset of the acknowledgement / error byte in a reply
 */
constexpr size_t ACK_OFFSET = 5;

/**
 * @brief Size of a reply frame with no payload
 *
 * HEADER(2) + LEN(2) + OPCODE(1) + ACK(1) + CHECKSUM(1) + FOOTER(2)
 */
constexpr size_t REPLY_BASE_SIZE = 9;

/* ========================================================================= */
/* Frame structure                                                           */
/* ========================================================================= */

/**
 * Request frame format:
 *
 * [0xFF][0xF9][LEN_H][LEN_L][OPCODE][PAYLOAD...][CHECKSUM][0xF5][0xE7]
 *
 * - LEN:      2 bytes, big-endian, counts OPCODE through CHECKSUM inclusive
 *             (always total frame size - 6)
 * - OPCODE:   1 byte (see Opcode)
 * - PAYLOAD:  opcode specific, multi-byte integers big-endian
 * - CHECKSUM: CRC-8 (poly 0x07, init 0x00) of bytes [2, size - 3), that is
 *             [LEN_H][LEN_L][OPCODE][PAYLOAD...]
 *
 * Reply frame format:
 *
 * [0xFF][0xF9][LEN_H][LEN_L][OPCODE][ACK][DATA...][CHECKSUM][0xF5][0xE7]
 *
 * - ACK:  status byte, always at offset 5
 * - DATA: present for the read family only, exactly the requested length
 *
 * Minimum request size: 8 bytes (Halt / Resume)
 * Minimum reply size:   9 bytes
 */

/* ========================================================================= */
/* Opcodes                                                                   */
/* ========================================================================= */

/**
 * @brief Request opcodes
 */
enum class Opcode : uint8_t
{
  /**
   * @brief Halt the target core
   *
   * No payload. Reply: ACK_OK / ERR_CONTROL.
   */
  HALT = 0xC1,

  /**
   * @brief Resume the target core
   *
   * No payload. Reply: ACK_OK / ERR_CONTROL.
   */
  RESUME = 0xC2,

  /**
   * @brief Read one 32-bit word
   *
   * Payload: ADDR(4). Reply: ACK_DATA + 4 bytes / ERR_READ.
   */
  READ_WORD = 0xC3,

  /**
   * @brief Write raw bytes
   *
   * Payload: ADDR(4) + DATA(n). Reply: ACK_OK / ERR_CONTROL.
   */
  WRITE = 0xC4,

  /**
   * @brief Read a byte range
   *
   * Payload: ADDR(4) + LEN(2). Reply: ACK_DATA + LEN bytes / ERR_READ.
   */
  READ_BYTES = 0xC6,

  /**
   * @brief Read consecutive 32-bit words
   *
   * Payload: ADDR(4) + COUNT(2). Reply: ACK_DATA + COUNT*4 bytes / ERR_READ.
   */
  READ_WORDS = 0xC7,
};

/* ========================================================================= */
/* Reply status codes                                                        */
/* ========================================================================= */

/**
 * @brief Status byte found at ACK_OFFSET in a reply
 */
enum class Status : uint8_t
{
  ACK_OK = 0xD1,       ///< Control / write accepted
  ACK_DATA = 0xD2,     ///< Read accepted, data follows
  ERR_CONTROL = 0xE1,  ///< Control / write rejected
  ERR_READ = 0xE3,     ///< Read rejected
};

/**
 * @brief Acknowledgement and error status expected for one opcode
 */
struct ResponseCodes
{
  Status ack;
  Status error;
};

/**
 * @brief Look up the reply codes of an opcode
 */
constexpr ResponseCodes response_codes(Opcode op)
{
  return (op == Opcode::READ_WORD || op == Opcode::READ_BYTES || op == Opcode::READ_WORDS)
             ? ResponseCodes{Status::ACK_DATA, Status::ERR_READ}
             : ResponseCodes{Status::ACK_OK, Status::ERR_CONTROL};
}

/* ========================================================================= */
/* Host-side error codes                                                     */
/* ========================================================================= */

/**
 * @brief Result of every fallible probelink operation
 *
 * Defined via errors.def for consistency with the C API.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "probelink/errors.def"
#undef ERR
};

/**
 * @brief Get a static description of an error code
 */
const char* error_message(ErrorCode code);

/**
 * @brief Get the mnemonic of an opcode ("HALT", "READ_WORD", ...)
 */
const char* opcode_name(Opcode op);

}  // namespace link
}  // namespace probe
