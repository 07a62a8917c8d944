/**
 * @file crc32.hpp
 * @brief Block checksum calculation (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "probelink/protocol.hpp"

namespace probe
{
namespace link
{
namespace internal
{

/**
 * @brief Feed bytes into a running reflected CRC-32
 *
 * Polynomial 0xEDB88320, LSB first. The accumulator is never complemented,
 * so the value returned after the last call is the digest itself. This is
 * the bitwise complement of the textbook CRC-32 of the same input.
 *
 * @param crc  Accumulator from a previous call (CRC32_INIT to start)
 * @param data Pointer to data buffer
 * @param len  Length of data in bytes
 * @return Updated accumulator
 */
uint32_t update_crc32(uint32_t crc, const uint8_t* data, size_t len);

/**
 * @brief Calculate the block checksum of one buffer
 */
inline uint32_t calc_crc32(const uint8_t* data, size_t len)
{
  return update_crc32(CRC32_INIT, data, len);
}

}  // namespace internal
}  // namespace link
}  // namespace probe
