/**
 * @file shared_session.hpp
 * @brief Session shared between several callers
 *
 * The protocol carries no request identifiers, so two requests in flight on
 * one link would receive each other's replies. SharedSession holds one lock
 * for the whole request/reply exchange of every operation.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "probelink/session.hpp"

namespace probe
{
namespace link
{

class SharedSession
{
 public:
  explicit SharedSession(std::unique_ptr<Transport> transport,
                         SessionConfig config = SessionConfig(),
                         TargetProfile profile = mspm0g3507_profile());

  ErrorCode halt();
  ErrorCode resume();
  ErrorCode write_word(uint32_t address, uint32_t value);
  ErrorCode read_bytes(uint32_t address, uint32_t length, std::vector<uint8_t>& out);
  ErrorCode read_word(uint32_t address, uint32_t& value);
  ErrorCode read_words(uint32_t address, uint32_t count, std::vector<uint32_t>& out);
  ErrorCode read_register(uint8_t index, uint32_t& value);
  ErrorCode read_pc(uint32_t& value);

  /**
   * @brief Reconnect
   *
   * Waits for the operation in flight (if any) to finish, then swaps the
   * channel. That operation reports its own failure; nothing is retried.
   */
  void replace_transport(std::unique_ptr<Transport> transport);

  bool is_open() const;

  /**
   * @brief Run several operations without interleaving other callers
   *
   * @param fn Receives the underlying session; must not call back into this
   *           SharedSession
   */
  ErrorCode with_session(const std::function<ErrorCode(Session&)>& fn);

 private:
  mutable std::mutex mutex_;
  Session session_;
};

}  // namespace link
}  // namespace probe
