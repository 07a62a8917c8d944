/**
 * @file session.cpp
 * @brief probelink device session implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "probelink/session.hpp"

#include <chrono>
#include <thread>

#include "frame.hpp"
#include "probelink/log.hpp"

namespace probe
{
namespace link
{

namespace
{

// DCRSR.REGSEL is seven bits wide
constexpr uint8_t MAX_REGISTER_INDEX = 0x7F;

uint32_t get_u32_be(const uint8_t* p)
{
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void log_frame(const char* direction, Opcode op, const uint8_t* data, size_t len)
{
  if (log_enabled(LogLevel::DEBUG))
  {
    const std::string hex = hex_string(data, len);
    PROBELINK_LOG_D("%s %s (%zu bytes): %s", direction, opcode_name(op), len, hex.c_str());
  }
}

}  // namespace

Session::Session(std::unique_ptr<Transport> transport, SessionConfig config,
                 TargetProfile profile)
    : transport_(std::move(transport)), config_(config), profile_(std::move(profile))
{
  // Room for at least one complete control reply
  if (config_.control_reply_capacity < REPLY_BASE_SIZE)
  {
    config_.control_reply_capacity = REPLY_BASE_SIZE;
  }
}

ErrorCode Session::halt()
{
  return control(Halt{});
}

ErrorCode Session::resume()
{
  return control(Resume{});
}

ErrorCode Session::write_word(uint32_t address, uint32_t value)
{
  std::vector<uint8_t> data = {
      static_cast<uint8_t>((value >> 24) & 0xFF),
      static_cast<uint8_t>((value >> 16) & 0xFF),
      static_cast<uint8_t>((value >> 8) & 0xFF),
      static_cast<uint8_t>(value & 0xFF),
  };
  return control(Write{address, std::move(data)});
}

ErrorCode Session::write_bytes(uint32_t address, const std::vector<uint8_t>& data)
{
  return control(Write{address, data});
}

ErrorCode Session::read_bytes(uint32_t address, uint32_t length, std::vector<uint8_t>& out)
{
  return query(ReadBytes{address, length}, out);
}

ErrorCode Session::read_word(uint32_t address, uint32_t& value)
{
  std::vector<uint8_t> payload;
  const ErrorCode err = query(ReadWord{address}, payload);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  value = get_u32_be(payload.data());
  return ErrorCode::OK;
}

ErrorCode Session::read_words(uint32_t address, uint32_t count, std::vector<uint32_t>& out)
{
  std::vector<uint8_t> payload;
  const ErrorCode err = query(ReadWords{address, count}, payload);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  out.clear();
  out.reserve(count);
  for (size_t i = 0; i + 4 <= payload.size(); i += 4)
  {
    out.push_back(get_u32_be(&payload[i]));
  }
  return ErrorCode::OK;
}

ErrorCode Session::read_register(uint8_t index, uint32_t& value)
{
  if (index > MAX_REGISTER_INDEX)
  {
    return ErrorCode::INVALID_ARGUMENT;
  }

  // Select the register, let the core move it into DCRDR, then fetch it
  const ErrorCode err = write_word(profile_.debug_select_address, index);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  delay(config_.register_select_delay_ms);

  return read_word(profile_.debug_data_address, value);
}

ErrorCode Session::read_pc(uint32_t& value)
{
  return read_register(profile_.pc_register, value);
}

ErrorCode Session::set_breakpoint(uint32_t address)
{
  PROBELINK_LOG_W("set_breakpoint(0x%08X): not supported by the probe", address);
  return ErrorCode::NOT_IMPLEMENTED;
}

void Session::replace_transport(std::unique_ptr<Transport> transport)
{
  transport_ = std::move(transport);
  PROBELINK_LOG_I("transport %s", transport_ ? "replaced" : "closed");
}

ErrorCode Session::send(const Command& cmd)
{
  if (!transport_)
  {
    return ErrorCode::NOT_OPEN;
  }

  std::vector<uint8_t> frame;
  ErrorCode err = internal::encode_command(cmd, frame);
  if (err != ErrorCode::OK)
  {
    PROBELINK_LOG_E("cannot encode %s: %s", opcode_name(opcode_of(cmd)), error_message(err));
    return err;
  }

  // Leftovers of an earlier reply would shift this one
  err = transport_->discard_input();
  if (err != ErrorCode::OK)
  {
    return err;
  }

  log_frame("tx", opcode_of(cmd), frame.data(), frame.size());

  err = transport_->write(frame.data(), frame.size());
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return transport_->flush();
}

ErrorCode Session::control(const Command& cmd)
{
  ErrorCode err = send(cmd);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  delay(config_.settle_delay_ms);

  const Opcode op = opcode_of(cmd);
  std::vector<uint8_t> reply(config_.control_reply_capacity);
  size_t received = 0;
  err = read_frame(config_.control_reply_timeout_ms, reply, received);

  if (err == ErrorCode::TIMEOUT)
  {
    // The probe does not always echo control requests
    if (received == 0)
    {
      PROBELINK_LOG_D("rx %s: no reply (ignored)", opcode_name(op));
    }
    else
    {
      PROBELINK_LOG_D("rx %s: %zu bytes of a reply (ignored)", opcode_name(op), received);
    }
    return ErrorCode::OK;
  }
  if (err != ErrorCode::OK)
  {
    return err;
  }

  log_frame("rx", op, reply.data(), received);

  std::vector<uint8_t> ack;
  const ErrorCode reply_err = internal::decode_reply(cmd, reply.data(), received, ack);
  if (reply_err == ErrorCode::DEVICE_REJECTED)
  {
    PROBELINK_LOG_W("rx %s: rejected by device", opcode_name(op));
    return ErrorCode::DEVICE_REJECTED;
  }
  if (reply_err != ErrorCode::OK)
  {
    PROBELINK_LOG_W("rx %s: %s (ignored)", opcode_name(op), error_message(reply_err));
  }

  return ErrorCode::OK;
}

ErrorCode Session::read_frame(uint32_t timeout_ms, std::vector<uint8_t>& buf,
                              size_t& received)
{
  using Clock = std::chrono::steady_clock;
  const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

  received = 0;
  size_t wanted = buf.size();
  uint32_t window = timeout_ms;

  for (;;)
  {
    ErrorCode err = transport_->set_timeout(window);
    if (err != ErrorCode::OK)
    {
      return err;
    }

    size_t n = 0;
    err = transport_->read(buf.data() + received, wanted - received, n);
    if (err != ErrorCode::OK)
    {
      return err;
    }
    received += n;

    if (received >= 2 && (buf[0] != HEADER_0 || buf[1] != HEADER_1))
    {
      // Not a frame; the decoder reports it
      return ErrorCode::OK;
    }

    // The length field tells where the frame ends
    if (received >= 4)
    {
      wanted = ((static_cast<size_t>(buf[2]) << 8) | buf[3]) + FRAME_OVERHEAD;
      if (wanted > buf.size())
      {
        buf.resize(wanted);
      }
    }

    if (received >= wanted)
    {
      // Bytes past the frame end are not part of this reply
      received = wanted;
      return ErrorCode::OK;
    }

    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    if (remaining <= 0)
    {
      return ErrorCode::TIMEOUT;
    }
    window = static_cast<uint32_t>(remaining);
  }
}

ErrorCode Session::query(const Command& cmd, std::vector<uint8_t>& payload)
{
  ErrorCode err = send(cmd);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  delay(config_.settle_delay_ms);

  err = transport_->set_timeout(config_.read_timeout_ms);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  const Opcode op = opcode_of(cmd);
  std::vector<uint8_t> reply(expected_reply_size(cmd));
  size_t received = 0;
  err = transport_->read_exact(reply.data(), reply.size(), received);

  if (err == ErrorCode::TIMEOUT)
  {
    if (received == 0)
    {
      PROBELINK_LOG_W("rx %s: no reply", opcode_name(op));
      return ErrorCode::TIMEOUT;
    }

    // A rejection is shorter than the data reply that was waited for
    log_frame("rx", op, reply.data(), received);
    std::vector<uint8_t> ignored;
    if (internal::decode_reply(cmd, reply.data(), received, ignored) ==
        ErrorCode::DEVICE_REJECTED)
    {
      PROBELINK_LOG_W("rx %s: rejected by device", opcode_name(op));
      return ErrorCode::DEVICE_REJECTED;
    }

    PROBELINK_LOG_W("rx %s: %zu of %zu bytes", opcode_name(op), received, reply.size());
    return ErrorCode::SHORT_REPLY;
  }
  if (err != ErrorCode::OK)
  {
    return err;
  }

  log_frame("rx", op, reply.data(), received);

  err = internal::decode_reply(cmd, reply.data(), received, payload);
  if (err != ErrorCode::OK)
  {
    PROBELINK_LOG_W("rx %s: %s", opcode_name(op), error_message(err));
  }
  return err;
}

void Session::delay(uint32_t ms) const
{
  if (ms > 0)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
  }
}

}  // namespace link
}  // namespace probe
