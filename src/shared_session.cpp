/**
 * @file shared_session.cpp
 * @brief Serialized session implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "probelink/shared_session.hpp"

namespace probe
{
namespace link
{

SharedSession::SharedSession(std::unique_ptr<Transport> transport, SessionConfig config,
                             TargetProfile profile)
    : session_(std::move(transport), config, std::move(profile))
{
}

ErrorCode SharedSession::halt()
{
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.halt();
}

ErrorCode SharedSession::resume()
{
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.resume();
}

ErrorCode SharedSession::write_word(uint32_t address, uint32_t value)
{
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.write_word(address, value);
}

ErrorCode SharedSession::read_bytes(uint32_t address, uint32_t length, std::vector<uint8_t>& out)
{
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.read_bytes(address, length, out);
}

ErrorCode SharedSession::read_word(uint32_t address, uint32_t& value)
{
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.read_word(address, value);
}

ErrorCode SharedSession::read_words(uint32_t address, uint32_t count, std::vector<uint32_t>& out)
{
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.read_words(address, count, out);
}

ErrorCode SharedSession::read_register(uint8_t index, uint32_t& value)
{
  // DCRSR write and DCRDR read must not be split by another caller
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.read_register(index, value);
}

ErrorCode SharedSession::read_pc(uint32_t& value)
{
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.read_pc(value);
}

void SharedSession::replace_transport(std::unique_ptr<Transport> transport)
{
  std::lock_guard<std::mutex> lock(mutex_);
  session_.replace_transport(std::move(transport));
}

bool SharedSession::is_open() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.is_open();
}

ErrorCode SharedSession::with_session(const std::function<ErrorCode(Session&)>& fn)
{
  std::lock_guard<std::mutex> lock(mutex_);
  return fn(session_);
}

}  // namespace link
}  // namespace probe
