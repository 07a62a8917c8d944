/**
 * @file crc8.hpp
 * @brief Frame checksum calculation (internal)
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
namespace internal
{

/**
 * @brief Feed bytes into a running CRC-8
 *
 * Polynomial 0x07 (x^8 + x^2 + x + 1), MSB first, no reflection,
 * no final XOR.
 *
 * @param crc  Accumulator from a previous call (0x00 to start)
 * @param data Pointer to data buffer
 * @param len  Length of data in bytes
 * @return Updated accumulator
 */
uint8_t update_crc8(uint8_t crc, const uint8_t* data, size_t len);

/**
 * @brief Calculate CRC-8 checksum with initial value 0x00
 */
inline uint8_t calc_crc8(const uint8_t* data, size_t len)
{
  return update_crc8(0x00, data, len);
}

}  // namespace internal
}  // namespace link
}  // namespace probe
