/**
 * @file probelink.h
 * @brief probelink C API
 *
 * C-compatible interface for the probelink device session.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Protocol constants                                                        */
  /* ========================================================================= */

  /** @brief Maximum ReadBytes length / Write payload */
#define PROBELINK_MAX_PAYLOAD_SIZE 4096

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) PROBELINK_ERR_##name = val,
#include "probelink/errors.def"
#undef ERR
  } probelink_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* probelink_strerror(probelink_error_t err);

  /* ========================================================================= */
  /* Transport callbacks                                                       */
  /* ========================================================================= */

  /**
   * @brief Byte channel supplied by the caller
   *
   * Semantics match probe::link::Transport. @c flush, @c set_timeout and
   * @c discard_input may be NULL when the channel has nothing to do for them.
   */
  typedef struct
  {
    probelink_error_t (*write)(void* user, const uint8_t* data, size_t len);
    probelink_error_t (*flush)(void* user);
    probelink_error_t (*read)(void* user, uint8_t* buf, size_t capacity, size_t* received);
    probelink_error_t (*read_exact)(void* user, uint8_t* buf, size_t len, size_t* received);
    probelink_error_t (*set_timeout)(void* user, uint32_t timeout_ms);
    probelink_error_t (*discard_input)(void* user);
  } probelink_transport_ops;

  /**
   * @brief Session timing, see probe::link::SessionConfig
   */
  typedef struct
  {
    uint32_t settle_delay_ms;
    uint32_t control_reply_timeout_ms;
    uint32_t read_timeout_ms;
    uint32_t register_select_delay_ms;
  } probelink_timing;

  /* ========================================================================= */
  /* Session handle                                                            */
  /* ========================================================================= */

  /** @brief Opaque handle to Session instance */
  typedef struct ProbeSession ProbeSession;

  /* ========================================================================= */
  /* Lifecycle functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Create a new session
   *
   * @param ops    Transport callbacks (copied; write, read, read_exact required)
   * @param user   User context pointer passed to every callback
   * @param timing Timing policy, or NULL for the defaults
   * @return Pointer to session, or NULL on invalid arguments / allocation failure
   */
  ProbeSession* probelink_session_create(const probelink_transport_ops* ops, void* user,
                                         const probelink_timing* timing);

  /**
   * @brief Destroy session and free resources
   * @param session Session instance (NULL-safe)
   */
  void probelink_session_destroy(ProbeSession* session);

  /* ========================================================================= */
  /* Operation functions                                                       */
  /* ========================================================================= */

  probelink_error_t probelink_halt(ProbeSession* session);
  probelink_error_t probelink_resume(ProbeSession* session);
  probelink_error_t probelink_write_word(ProbeSession* session, uint32_t address, uint32_t value);
  probelink_error_t probelink_read_word(ProbeSession* session, uint32_t address, uint32_t* value);

  /**
   * @brief Read @p len bytes into @p buf
   */
  probelink_error_t probelink_read_bytes(ProbeSession* session, uint32_t address, uint8_t* buf,
                                         size_t len);

  probelink_error_t probelink_read_register(ProbeSession* session, uint8_t index,
                                            uint32_t* value);
  probelink_error_t probelink_read_pc(ProbeSession* session, uint32_t* value);

#ifdef __cplusplus
} /* extern "C" */
#endif
