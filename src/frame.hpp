/**
 * @file frame.hpp
 * @brief Frame encoding/decoding utilities (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "probelink/command.hpp"
#include "probelink/protocol.hpp"

namespace probe
{
namespace link
{
namespace internal
{

/**
 * @brief Validated view into a received frame
 *
 * @c body points into the caller's buffer and spans the bytes between the
 * opcode and the checksum.
 */
struct FrameView
{
  uint8_t opcode;
  const uint8_t* body;
  size_t body_len;
};

/**
 * @brief Encode a frame with opcode and body
 *
 * Generates a complete frame:
 * [0xFF][0xF9][LEN_H][LEN_L][OPCODE][BODY...][CHECKSUM][0xF5][0xE7]
 *
 * @param op   Opcode byte
 * @param data Body bytes (can be nullptr if len == 0)
 * @param len  Body length in bytes
 * @param out  Output buffer for encoded frame
 * @return true on success, false if the length field would overflow
 */
bool encode_frame(uint8_t op, const uint8_t* data, size_t len, std::vector<uint8_t>& out);

/**
 * @brief Encode a request frame for a command
 *
 * @return ErrorCode::OK, or ErrorCode::PAYLOAD_TOO_LARGE when a ReadBytes
 *         length, ReadWords reply or Write payload exceeds MAX_PAYLOAD_SIZE
 */
ErrorCode encode_command(const Command& cmd, std::vector<uint8_t>& out);

/**
 * @brief Encode a reply frame as the probe would send it
 *
 * [0xFF][0xF9][LEN_H][LEN_L][OPCODE][STATUS][DATA...][CHECKSUM][0xF5][0xE7]
 *
 * @param op       Opcode being answered
 * @param status   Status byte placed at ACK_OFFSET
 * @param out      Output buffer for encoded frame
 * @param data     Optional reply data (nullptr for control replies)
 * @param data_len Reply data length in bytes
 */
void encode_reply(Opcode op, uint8_t status, std::vector<uint8_t>& out,
                  const uint8_t* data = nullptr, size_t data_len = 0);

/**
 * @brief Compute the checksum a frame should carry
 *
 * CRC-8 over bytes [2, size - 3): length field, opcode and body.
 *
 * @param frame Complete frame buffer
 * @param size  Total frame length (at least FRAME_OVERHEAD + 2)
 */
uint8_t frame_checksum(const uint8_t* frame, size_t size);

/**
 * @brief Verify frame checksum
 *
 * @return true if the checksum byte at size - 3 matches frame_checksum()
 */
bool verify_frame_crc(const uint8_t* frame, size_t size);

/**
 * @brief Validate the envelope of a received frame
 *
 * Checks header, length field, footer and checksum, in that order.
 *
 * @return ErrorCode::OK, SHORT_REPLY, INVALID_FRAME or CHECKSUM_MISMATCH
 */
ErrorCode parse_frame(const uint8_t* frame, size_t size, FrameView& view);

/**
 * @brief Classify a reply to @p cmd
 *
 * On acknowledgement @p payload receives the reply data for the read family,
 * or the single ACK byte for control and write commands.
 *
 * @return ErrorCode::OK, DEVICE_REJECTED, UNEXPECTED_RESPONSE, or a
 *         parse_frame() failure
 */
ErrorCode decode_reply(const Command& cmd, const uint8_t* frame, size_t size,
                       std::vector<uint8_t>& payload);

}  // namespace internal
}  // namespace link
}  // namespace probe
