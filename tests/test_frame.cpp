/**
 * @file test_frame.cpp
 * @brief Checksum and frame codec unit tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <cstring>
#include <vector>

#include "crc32.hpp"
#include "crc8.hpp"
#include "frame.hpp"
#include "probelink/command.hpp"
#include "probelink/protocol.hpp"

using namespace probe::link;

/* ========================================================================= */
/* CRC8 Tests                                                                */
/* ========================================================================= */

TEST_CASE("CRC8 calculation")
{
  SUBCASE("Empty data")
  {
    const uint8_t data[1] = {0};
    CHECK(internal::calc_crc8(data, 0) == 0x00);
  }

  SUBCASE("Known test vector")
  {
    // CRC-8 with poly 0x07, init 0x00 over "123456789"
    const uint8_t data[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    CHECK(internal::calc_crc8(data, 9) == 0xF4);
  }

  SUBCASE("Incremental update matches one shot")
  {
    const uint8_t data[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    const uint8_t head = internal::calc_crc8(data, 4);
    CHECK(internal::update_crc8(head, data + 4, 5) == 0xF4);
  }

  SUBCASE("Different data produces different CRC")
  {
    const uint8_t data1[] = {0x01, 0x02, 0x03};
    const uint8_t data2[] = {0x01, 0x02, 0x04};
    CHECK(internal::calc_crc8(data1, 3) != internal::calc_crc8(data2, 3));
  }
}

/* ========================================================================= */
/* CRC32 Tests                                                               */
/* ========================================================================= */

TEST_CASE("CRC32 block checksum")
{
  SUBCASE("Empty input returns the seed")
  {
    const uint8_t data[1] = {0};
    CHECK(internal::calc_crc32(data, 0) == 0xFFFFFFFF);
  }

  SUBCASE("No final complement")
  {
    // Textbook CRC-32("123456789") is 0xCBF43926
    const uint8_t data[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    const uint32_t crc = internal::calc_crc32(data, 9);
    CHECK(crc == 0x340BC6D9);
    CHECK(~crc == 0xCBF43926);
  }

  SUBCASE("Single zero byte")
  {
    // Textbook CRC-32 of {0x00} is 0xD202EF8D
    const uint8_t data[] = {0x00};
    CHECK(internal::calc_crc32(data, 1) == static_cast<uint32_t>(~0xD202EF8Du));
  }

  SUBCASE("Incremental update matches one shot")
  {
    const uint8_t data[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
    uint32_t crc = internal::update_crc32(CRC32_INIT, data, 2);
    crc = internal::update_crc32(crc, data + 2, 7);
    CHECK(crc == internal::calc_crc32(data, 9));
  }
}

/* ========================================================================= */
/* Frame Encoding Tests                                                      */
/* ========================================================================= */

TEST_CASE("Frame encoding")
{
  SUBCASE("Halt")
  {
    std::vector<uint8_t> frame;
    REQUIRE(internal::encode_command(Halt{}, frame) == ErrorCode::OK);

    const std::vector<uint8_t> expected = {0xFF, 0xF9, 0x00, 0x02, 0xC1, 0x63, 0xF5, 0xE7};
    CHECK(frame == expected);
  }

  SUBCASE("Resume")
  {
    std::vector<uint8_t> frame;
    REQUIRE(internal::encode_command(Resume{}, frame) == ErrorCode::OK);

    const std::vector<uint8_t> expected = {0xFF, 0xF9, 0x00, 0x02, 0xC2, 0x6A, 0xF5, 0xE7};
    CHECK(frame == expected);
  }

  SUBCASE("ReadWord")
  {
    std::vector<uint8_t> frame;
    REQUIRE(internal::encode_command(ReadWord{0x20000010}, frame) == ErrorCode::OK);

    const std::vector<uint8_t> expected = {0xFF, 0xF9, 0x00, 0x06, 0xC3, 0x20, 0x00,
                                           0x00, 0x10, 0xB1, 0xF5, 0xE7};
    CHECK(frame == expected);
  }

  SUBCASE("ReadBytes")
  {
    std::vector<uint8_t> frame;
    REQUIRE(internal::encode_command(ReadBytes{0x00012345, 0x0104}, frame) == ErrorCode::OK);

    REQUIRE(frame.size() == 14);
    CHECK(frame[2] == 0x00);  // LEN_H
    CHECK(frame[3] == 0x08);  // LEN_L: OPCODE + ADDR(4) + LEN(2) + CHECKSUM
    CHECK(frame[4] == 0xC6);
    CHECK(frame[5] == 0x00);
    CHECK(frame[6] == 0x01);
    CHECK(frame[7] == 0x23);
    CHECK(frame[8] == 0x45);
    CHECK(frame[9] == 0x01);
    CHECK(frame[10] == 0x04);
    CHECK(frame[11] == internal::frame_checksum(frame.data(), frame.size()));
    CHECK(frame[12] == FOOTER_0);
    CHECK(frame[13] == FOOTER_1);
  }

  SUBCASE("ReadWords")
  {
    std::vector<uint8_t> frame;
    REQUIRE(internal::encode_command(ReadWords{0xE000ED00, 3}, frame) == ErrorCode::OK);

    REQUIRE(frame.size() == 14);
    CHECK(frame[4] == 0xC7);
    CHECK(frame[5] == 0xE0);
    CHECK(frame[8] == 0x00);
    CHECK(frame[9] == 0x00);
    CHECK(frame[10] == 0x03);
  }

  SUBCASE("Write")
  {
    std::vector<uint8_t> frame;
    const Write cmd{0xE000EDF4, {0x00, 0x00, 0x00, 0x0F}};
    REQUIRE(internal::encode_command(cmd, frame) == ErrorCode::OK);

    REQUIRE(frame.size() == 16);
    CHECK(frame[3] == 0x0A);
    CHECK(frame[4] == 0xC4);
    CHECK(frame[5] == 0xE0);
    CHECK(frame[6] == 0x00);
    CHECK(frame[7] == 0xED);
    CHECK(frame[8] == 0xF4);
    CHECK(frame[12] == 0x0F);
  }

  SUBCASE("Payload too large")
  {
    std::vector<uint8_t> frame;
    CHECK(internal::encode_command(ReadBytes{0, MAX_PAYLOAD_SIZE + 1}, frame) ==
          ErrorCode::PAYLOAD_TOO_LARGE);
    CHECK(internal::encode_command(ReadWords{0, MAX_PAYLOAD_SIZE / 4 + 1}, frame) ==
          ErrorCode::PAYLOAD_TOO_LARGE);

    Write big{0, std::vector<uint8_t>(MAX_PAYLOAD_SIZE + 1, 0xAA)};
    CHECK(internal::encode_command(big, frame) == ErrorCode::PAYLOAD_TOO_LARGE);
  }

  SUBCASE("Largest payloads are accepted")
  {
    std::vector<uint8_t> frame;
    CHECK(internal::encode_command(ReadBytes{0, MAX_PAYLOAD_SIZE}, frame) == ErrorCode::OK);

    Write big{0, std::vector<uint8_t>(MAX_PAYLOAD_SIZE, 0xAA)};
    REQUIRE(internal::encode_command(big, frame) == ErrorCode::OK);
    CHECK(frame.size() == FRAME_OVERHEAD + 1 + 4 + MAX_PAYLOAD_SIZE + 1);
  }
}

TEST_CASE("Length field equals frame size minus six")
{
  std::vector<uint8_t> frame;

  for (size_t size = 0; size <= MAX_PAYLOAD_SIZE; ++size)
  {
    Write cmd{0x1000, std::vector<uint8_t>(size, static_cast<uint8_t>(size))};
    REQUIRE(internal::encode_command(cmd, frame) == ErrorCode::OK);

    const size_t declared = (static_cast<size_t>(frame[2]) << 8) | frame[3];
    REQUIRE(declared == frame.size() - FRAME_OVERHEAD);
    REQUIRE(internal::verify_frame_crc(frame.data(), frame.size()));
  }

  const Command others[] = {Halt{}, Resume{}, ReadWord{4}, ReadBytes{4, 4096}, ReadWords{4, 2}};
  for (const Command& cmd : others)
  {
    REQUIRE(internal::encode_command(cmd, frame) == ErrorCode::OK);
    const size_t declared = (static_cast<size_t>(frame[2]) << 8) | frame[3];
    CHECK(declared == frame.size() - FRAME_OVERHEAD);
  }
}

/* ========================================================================= */
/* Frame Checksum Tests                                                      */
/* ========================================================================= */

TEST_CASE("Frame checksum")
{
  std::vector<uint8_t> frame;
  REQUIRE(internal::encode_command(Write{0x20000000, {1, 2, 3, 4, 5}}, frame) == ErrorCode::OK);

  SUBCASE("Stable on an unmodified frame")
  {
    const uint8_t first = internal::frame_checksum(frame.data(), frame.size());
    CHECK(internal::frame_checksum(frame.data(), frame.size()) == first);
    CHECK(internal::verify_frame_crc(frame.data(), frame.size()));
  }

  SUBCASE("Covers exactly bytes [2, size - 3)")
  {
    CHECK(internal::frame_checksum(frame.data(), frame.size()) ==
          internal::calc_crc8(&frame[2], frame.size() - 5));

    // Header and footer are outside the span
    std::vector<uint8_t> copy = frame;
    copy[0] = 0x00;
    copy[copy.size() - 1] = 0x00;
    CHECK(internal::frame_checksum(copy.data(), copy.size()) ==
          internal::frame_checksum(frame.data(), frame.size()));
  }

  SUBCASE("Any single bit flip inside the span is detected")
  {
    for (size_t i = 2; i < frame.size() - 3; ++i)
    {
      for (int bit = 0; bit < 8; ++bit)
      {
        std::vector<uint8_t> copy = frame;
        copy[i] ^= static_cast<uint8_t>(1u << bit);
        CHECK_FALSE(internal::verify_frame_crc(copy.data(), copy.size()));
      }
    }
  }

  SUBCASE("Corrupted checksum byte")
  {
    frame[frame.size() - 3] ^= 0xFF;
    CHECK_FALSE(internal::verify_frame_crc(frame.data(), frame.size()));
  }

  SUBCASE("Frame too short")
  {
    const uint8_t short_frame[] = {HEADER_0, HEADER_1, 0x00};
    CHECK_FALSE(internal::verify_frame_crc(short_frame, 3));
  }
}

/* ========================================================================= */
/* Reply Decoding Tests                                                      */
/* ========================================================================= */

TEST_CASE("Reply decoding")
{
  std::vector<uint8_t> reply;
  std::vector<uint8_t> payload;

  SUBCASE("Control acknowledgement yields the ACK marker")
  {
    internal::encode_reply(Opcode::HALT, 0xD1, reply);
    REQUIRE(reply.size() == REPLY_BASE_SIZE);
    CHECK(reply[ACK_OFFSET] == 0xD1);

    REQUIRE(internal::decode_reply(Halt{}, reply.data(), reply.size(), payload) == ErrorCode::OK);
    CHECK(payload == std::vector<uint8_t>{0xD1});
  }

  SUBCASE("Write acknowledgement")
  {
    internal::encode_reply(Opcode::WRITE, 0xD1, reply);
    CHECK(internal::decode_reply(Write{0, {1}}, reply.data(), reply.size(), payload) ==
          ErrorCode::OK);
  }

  SUBCASE("ReadBytes returns the data")
  {
    const uint8_t data[] = {0xDE, 0xAD, 0xBE, 0xEF, 0x01, 0x02};
    internal::encode_reply(Opcode::READ_BYTES, 0xD2, reply, data, sizeof(data));
    REQUIRE(reply.size() == expected_reply_size(ReadBytes{0, 6}));

    REQUIRE(internal::decode_reply(ReadBytes{0, 6}, reply.data(), reply.size(), payload) ==
            ErrorCode::OK);
    CHECK(payload == std::vector<uint8_t>(data, data + sizeof(data)));
  }

  SUBCASE("ReadWords returns count * 4 bytes")
  {
    const std::vector<uint8_t> data(12, 0x5C);
    internal::encode_reply(Opcode::READ_WORDS, 0xD2, reply, data.data(), data.size());

    REQUIRE(internal::decode_reply(ReadWords{0, 3}, reply.data(), reply.size(), payload) ==
            ErrorCode::OK);
    CHECK(payload == data);
  }

  SUBCASE("Error codes are device rejections")
  {
    internal::encode_reply(Opcode::HALT, 0xE1, reply);
    CHECK(internal::decode_reply(Halt{}, reply.data(), reply.size(), payload) ==
          ErrorCode::DEVICE_REJECTED);

    internal::encode_reply(Opcode::READ_WORD, 0xE3, reply);
    CHECK(internal::decode_reply(ReadWord{0}, reply.data(), reply.size(), payload) ==
          ErrorCode::DEVICE_REJECTED);
  }

  SUBCASE("Codes of the other family are unrecognized")
  {
    internal::encode_reply(Opcode::READ_WORD, 0xD1, reply);
    CHECK(internal::decode_reply(ReadWord{0}, reply.data(), reply.size(), payload) ==
          ErrorCode::UNEXPECTED_RESPONSE);

    internal::encode_reply(Opcode::RESUME, 0xE3, reply);
    CHECK(internal::decode_reply(Resume{}, reply.data(), reply.size(), payload) ==
          ErrorCode::UNEXPECTED_RESPONSE);
  }

  SUBCASE("Checksum mismatch is a hard failure")
  {
    const uint8_t data[] = {1, 2, 3, 4};
    internal::encode_reply(Opcode::READ_WORD, 0xD2, reply, data, sizeof(data));
    reply[7] ^= 0x01;

    CHECK(internal::decode_reply(ReadWord{0}, reply.data(), reply.size(), payload) ==
          ErrorCode::CHECKSUM_MISMATCH);
  }

  SUBCASE("Truncated reply")
  {
    const uint8_t data[] = {1, 2, 3, 4};
    internal::encode_reply(Opcode::READ_WORD, 0xD2, reply, data, sizeof(data));

    CHECK(internal::decode_reply(ReadWord{0}, reply.data(), reply.size() - 2, payload) ==
          ErrorCode::SHORT_REPLY);
    CHECK(internal::decode_reply(ReadWord{0}, reply.data(), 5, payload) ==
          ErrorCode::SHORT_REPLY);
  }

  SUBCASE("Well-formed reply with too little data")
  {
    const uint8_t data[] = {1, 2};
    internal::encode_reply(Opcode::READ_WORD, 0xD2, reply, data, sizeof(data));

    CHECK(internal::decode_reply(ReadWord{0}, reply.data(), reply.size(), payload) ==
          ErrorCode::SHORT_REPLY);
  }

  SUBCASE("Broken envelope")
  {
    internal::encode_reply(Opcode::HALT, 0xD1, reply);

    std::vector<uint8_t> bad_header = reply;
    bad_header[1] = 0x00;
    CHECK(internal::decode_reply(Halt{}, bad_header.data(), bad_header.size(), payload) ==
          ErrorCode::INVALID_FRAME);

    std::vector<uint8_t> bad_footer = reply;
    bad_footer[bad_footer.size() - 1] = 0x00;
    CHECK(internal::decode_reply(Halt{}, bad_footer.data(), bad_footer.size(), payload) ==
          ErrorCode::INVALID_FRAME);

    std::vector<uint8_t> trailing = reply;
    trailing.push_back(0x00);
    CHECK(internal::decode_reply(Halt{}, trailing.data(), trailing.size(), payload) ==
          ErrorCode::INVALID_FRAME);
  }
}

TEST_CASE("Request round trip through parse_frame")
{
  const Command commands[] = {
      Halt{},
      Resume{},
      ReadWord{0x41C00004},
      ReadBytes{0x00000100, 17},
      ReadWords{0x20000000, 8},
      Write{0x20001000, {9, 8, 7, 6, 5, 4, 3}},
  };

  for (const Command& cmd : commands)
  {
    std::vector<uint8_t> frame;
    REQUIRE(internal::encode_command(cmd, frame) == ErrorCode::OK);

    internal::FrameView view{};
    REQUIRE(internal::parse_frame(frame.data(), frame.size(), view) == ErrorCode::OK);
    CHECK(view.opcode == static_cast<uint8_t>(opcode_of(cmd)));
    CHECK(view.body_len == frame.size() - FRAME_OVERHEAD - 2);

    // Simulated matching reply
    const size_t data_len = reply_payload_size(cmd);
    std::vector<uint8_t> data(data_len);
    for (size_t i = 0; i < data_len; ++i)
    {
      data[i] = static_cast<uint8_t>(i * 7 + 1);
    }

    std::vector<uint8_t> reply;
    internal::encode_reply(opcode_of(cmd), static_cast<uint8_t>(response_codes(opcode_of(cmd)).ack),
                           reply, data.data(), data.size());
    REQUIRE(reply.size() == expected_reply_size(cmd));

    std::vector<uint8_t> payload;
    REQUIRE(internal::decode_reply(cmd, reply.data(), reply.size(), payload) == ErrorCode::OK);
    if (data_len > 0)
    {
      CHECK(payload == data);
    }
    else
    {
      CHECK(payload.size() == 1);
    }
  }
}

TEST_CASE("Error messages")
{
  CHECK(std::strcmp(error_message(ErrorCode::OK), "ok") == 0);
  CHECK(std::strcmp(error_message(ErrorCode::CHECKSUM_MISMATCH), "frame checksum mismatch") == 0);
  CHECK(std::strcmp(opcode_name(Opcode::READ_WORDS), "READ_WORDS") == 0);
}
