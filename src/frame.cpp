/**
 * @file frame.cpp
 * @brief Frame encoding/decoding implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "frame.hpp"

#include "crc8.hpp"

namespace probe
{
namespace link
{
namespace internal
{

namespace
{

// OPCODE(1) + CHECKSUM(1) must fit next to the body in the 16-bit length
constexpr size_t MAX_BODY_SIZE = 0xFFFF - 2;

void put_u32_be(std::vector<uint8_t>& out, uint32_t value)
{
  out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void put_u16_be(std::vector<uint8_t>& out, uint16_t value)
{
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(value & 0xFF));
}

/**
 * @brief Builds the request body of each command alternative
 */
struct BodyBuilder
{
  std::vector<uint8_t>& body;

  ErrorCode operator()(const Halt&) const
  {
    return ErrorCode::OK;
  }

  ErrorCode operator()(const Resume&) const
  {
    return ErrorCode::OK;
  }

  ErrorCode operator()(const ReadBytes& c) const
  {
    if (c.length > MAX_PAYLOAD_SIZE)
    {
      return ErrorCode::PAYLOAD_TOO_LARGE;
    }
    put_u32_be(body, c.address);
    put_u16_be(body, static_cast<uint16_t>(c.length));
    return ErrorCode::OK;
  }

  ErrorCode operator()(const ReadWord& c) const
  {
    put_u32_be(body, c.address);
    return ErrorCode::OK;
  }

  ErrorCode operator()(const ReadWords& c) const
  {
    if (c.count > MAX_PAYLOAD_SIZE / 4)
    {
      return ErrorCode::PAYLOAD_TOO_LARGE;
    }
    put_u32_be(body, c.address);
    put_u16_be(body, static_cast<uint16_t>(c.count));
    return ErrorCode::OK;
  }

  ErrorCode operator()(const Write& c) const
  {
    if (c.data.size() > MAX_PAYLOAD_SIZE)
    {
      return ErrorCode::PAYLOAD_TOO_LARGE;
    }
    put_u32_be(body, c.address);
    body.insert(body.end(), c.data.begin(), c.data.end());
    return ErrorCode::OK;
  }
};

}  // namespace

bool encode_frame(uint8_t op, const uint8_t* data, size_t len, std::vector<uint8_t>& out)
{
  if (len > MAX_BODY_SIZE)
  {
    return false;
  }

  const size_t frame_size = FRAME_OVERHEAD + 2 + len;
  out.clear();
  out.reserve(frame_size);

  // Header, length placeholder, opcode
  out.push_back(HEADER_0);
  out.push_back(HEADER_1);
  out.push_back(0x00);
  out.push_back(0x00);
  out.push_back(op);

  // Body
  if (len > 0 && data != nullptr)
  {
    out.insert(out.end(), data, data + len);
  }

  // Checksum placeholder, footer
  out.push_back(0x00);
  out.push_back(FOOTER_0);
  out.push_back(FOOTER_1);

  // Backfill length (OPCODE..CHECKSUM inclusive), then checksum
  const size_t counted = out.size() - FRAME_OVERHEAD;
  out[2] = static_cast<uint8_t>((counted >> 8) & 0xFF);
  out[3] = static_cast<uint8_t>(counted & 0xFF);
  out[out.size() - 3] = frame_checksum(out.data(), out.size());

  return true;
}

ErrorCode encode_command(const Command& cmd, std::vector<uint8_t>& out)
{
  std::vector<uint8_t> body;
  const ErrorCode err = std::visit(BodyBuilder{body}, cmd);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (!encode_frame(static_cast<uint8_t>(opcode_of(cmd)), body.data(), body.size(), out))
  {
    return ErrorCode::PAYLOAD_TOO_LARGE;
  }

  return ErrorCode::OK;
}

void encode_reply(Opcode op, uint8_t status, std::vector<uint8_t>& out, const uint8_t* data,
                  size_t data_len)
{
  std::vector<uint8_t> body;
  body.reserve(1 + data_len);
  body.push_back(status);
  if (data_len > 0 && data != nullptr)
  {
    body.insert(body.end(), data, data + data_len);
  }

  encode_frame(static_cast<uint8_t>(op), body.data(), body.size(), out);
}

uint8_t frame_checksum(const uint8_t* frame, size_t size)
{
  if (size < FRAME_OVERHEAD - 1)
  {
    return 0x00;
  }

  // [LEN_H][LEN_L][OPCODE][BODY...], stops before CHECKSUM and footer
  return calc_crc8(&frame[2], size - 5);
}

bool verify_frame_crc(const uint8_t* frame, size_t size)
{
  // Minimum frame: HEADER(2) + LEN(2) + OPCODE + CHECKSUM + FOOTER(2)
  if (size < FRAME_OVERHEAD + 2)
  {
    return false;
  }

  return frame[size - 3] == frame_checksum(frame, size);
}

ErrorCode parse_frame(const uint8_t* frame, size_t size, FrameView& view)
{
  if (size < FRAME_OVERHEAD + 2)
  {
    return ErrorCode::SHORT_REPLY;
  }

  if (frame[0] != HEADER_0 || frame[1] != HEADER_1)
  {
    return ErrorCode::INVALID_FRAME;
  }

  const size_t declared = (static_cast<size_t>(frame[2]) << 8) | frame[3];
  if (declared < 2)
  {
    return ErrorCode::INVALID_FRAME;
  }
  if (declared + FRAME_OVERHEAD > size)
  {
    return ErrorCode::SHORT_REPLY;
  }
  if (declared + FRAME_OVERHEAD < size)
  {
    return ErrorCode::INVALID_FRAME;
  }

  if (frame[size - 2] != FOOTER_0 || frame[size - 1] != FOOTER_1)
  {
    return ErrorCode::INVALID_FRAME;
  }

  if (!verify_frame_crc(frame, size))
  {
    return ErrorCode::CHECKSUM_MISMATCH;
  }

  view.opcode = frame[OPCODE_OFFSET];
  view.body = frame + OPCODE_OFFSET + 1;
  view.body_len = declared - 2;

  return ErrorCode::OK;
}

ErrorCode decode_reply(const Command& cmd, const uint8_t* frame, size_t size,
                       std::vector<uint8_t>& payload)
{
  FrameView view{};
  const ErrorCode err = parse_frame(frame, size, view);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (view.body_len < 1)
  {
    return ErrorCode::SHORT_REPLY;
  }

  const ResponseCodes codes = response_codes(opcode_of(cmd));
  const uint8_t status = frame[ACK_OFFSET];

  if (status == static_cast<uint8_t>(codes.error))
  {
    return ErrorCode::DEVICE_REJECTED;
  }

  if (status != static_cast<uint8_t>(codes.ack))
  {
    return ErrorCode::UNEXPECTED_RESPONSE;
  }

  const size_t wanted = reply_payload_size(cmd);
  if (wanted == 0)
  {
    // Control and write replies carry only the ACK
    payload.assign(1, status);
    return ErrorCode::OK;
  }

  const size_t data_len = view.body_len - 1;
  if (data_len < wanted)
  {
    return ErrorCode::SHORT_REPLY;
  }
  if (data_len > wanted)
  {
    return ErrorCode::INVALID_FRAME;
  }

  payload.assign(view.body + 1, view.body + 1 + data_len);
  return ErrorCode::OK;
}

}  // namespace internal
}  // namespace link
}  // namespace probe
