/**
 * @file probelink_c_api.cpp
 * @brief probelink C API implementation
 *
 * C wrapper for the C++ Session class.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cstring>
#include <memory>
#include <new>

#include "probelink/probelink.h"
#include "probelink/session.hpp"

using namespace probe::link;

static_assert(PROBELINK_MAX_PAYLOAD_SIZE == MAX_PAYLOAD_SIZE, "C and C++ payload limits differ");

/* ========================================================================= */
/* Internal wrapper structures                                               */
/* ========================================================================= */

namespace
{

ErrorCode to_cpp(probelink_error_t err)
{
  return static_cast<ErrorCode>(err);
}

probelink_error_t to_c(ErrorCode err)
{
  return static_cast<probelink_error_t>(err);
}

/**
 * @brief Transport forwarding to C callbacks
 */
class CallbackTransport : public Transport
{
 public:
  CallbackTransport(const probelink_transport_ops& ops, void* user) : ops_(ops), user_(user)
  {
  }

  ErrorCode write(const uint8_t* data, size_t len) override
  {
    return to_cpp(ops_.write(user_, data, len));
  }

  ErrorCode flush() override
  {
    return ops_.flush ? to_cpp(ops_.flush(user_)) : ErrorCode::OK;
  }

  ErrorCode read(uint8_t* buf, size_t capacity, size_t& received) override
  {
    received = 0;
    return to_cpp(ops_.read(user_, buf, capacity, &received));
  }

  ErrorCode read_exact(uint8_t* buf, size_t len, size_t& received) override
  {
    received = 0;
    return to_cpp(ops_.read_exact(user_, buf, len, &received));
  }

  ErrorCode set_timeout(uint32_t timeout_ms) override
  {
    return ops_.set_timeout ? to_cpp(ops_.set_timeout(user_, timeout_ms)) : ErrorCode::OK;
  }

  ErrorCode discard_input() override
  {
    return ops_.discard_input ? to_cpp(ops_.discard_input(user_)) : ErrorCode::OK;
  }

 private:
  probelink_transport_ops ops_;
  void* user_;
};

}  // namespace

struct ProbeSession
{
  Session session;

  ProbeSession(std::unique_ptr<Transport> transport, const SessionConfig& config)
      : session(std::move(transport), config)
  {
  }
};

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* probelink_strerror(probelink_error_t err)
{
  return error_message(to_cpp(err));
}

/* ========================================================================= */
/* Lifecycle functions                                                       */
/* ========================================================================= */

ProbeSession* probelink_session_create(const probelink_transport_ops* ops, void* user,
                                       const probelink_timing* timing)
{
  if (ops == nullptr || ops->write == nullptr || ops->read == nullptr ||
      ops->read_exact == nullptr)
  {
    return nullptr;
  }

  SessionConfig config;
  if (timing != nullptr)
  {
    config.settle_delay_ms = timing->settle_delay_ms;
    config.control_reply_timeout_ms = timing->control_reply_timeout_ms;
    config.read_timeout_ms = timing->read_timeout_ms;
    config.register_select_delay_ms = timing->register_select_delay_ms;
  }

  std::unique_ptr<Transport> transport(new (std::nothrow) CallbackTransport(*ops, user));
  if (!transport)
  {
    return nullptr;
  }

  return new (std::nothrow) ProbeSession(std::move(transport), config);
}

void probelink_session_destroy(ProbeSession* session)
{
  delete session;
}

/* ========================================================================= */
/* Operation functions                                                       */
/* ========================================================================= */

probelink_error_t probelink_halt(ProbeSession* session)
{
  if (session == nullptr)
  {
    return PROBELINK_ERR_INVALID_ARGUMENT;
  }
  return to_c(session->session.halt());
}

probelink_error_t probelink_resume(ProbeSession* session)
{
  if (session == nullptr)
  {
    return PROBELINK_ERR_INVALID_ARGUMENT;
  }
  return to_c(session->session.resume());
}

probelink_error_t probelink_write_word(ProbeSession* session, uint32_t address, uint32_t value)
{
  if (session == nullptr)
  {
    return PROBELINK_ERR_INVALID_ARGUMENT;
  }
  return to_c(session->session.write_word(address, value));
}

probelink_error_t probelink_read_word(ProbeSession* session, uint32_t address, uint32_t* value)
{
  if (session == nullptr || value == nullptr)
  {
    return PROBELINK_ERR_INVALID_ARGUMENT;
  }
  return to_c(session->session.read_word(address, *value));
}

probelink_error_t probelink_read_bytes(ProbeSession* session, uint32_t address, uint8_t* buf,
                                       size_t len)
{
  if (session == nullptr || (buf == nullptr && len > 0))
  {
    return PROBELINK_ERR_INVALID_ARGUMENT;
  }
  if (len > PROBELINK_MAX_PAYLOAD_SIZE)
  {
    return PROBELINK_ERR_PAYLOAD_TOO_LARGE;
  }

  std::vector<uint8_t> data;
  const ErrorCode err =
      session->session.read_bytes(address, static_cast<uint32_t>(len), data);
  if (err == ErrorCode::OK && len > 0)
  {
    std::memcpy(buf, data.data(), len);
  }
  return to_c(err);
}

probelink_error_t probelink_read_register(ProbeSession* session, uint8_t index, uint32_t* value)
{
  if (session == nullptr || value == nullptr)
  {
    return PROBELINK_ERR_INVALID_ARGUMENT;
  }
  return to_c(session->session.read_register(index, *value));
}

probelink_error_t probelink_read_pc(ProbeSession* session, uint32_t* value)
{
  if (session == nullptr || value == nullptr)
  {
    return PROBELINK_ERR_INVALID_ARGUMENT;
  }
  return to_c(session->session.read_pc(*value));
}
