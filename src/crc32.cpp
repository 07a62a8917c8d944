/**
 * @file crc32.cpp
 * @brief Block checksum implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "crc32.hpp"

namespace probe
{
namespace link
{
namespace internal
{

uint32_t update_crc32(uint32_t crc, const uint8_t* data, size_t len)
{
  for (size_t i = 0; i < len; ++i)
  {
    crc ^= data[i];

    for (int bit = 0; bit < 8; ++bit)
    {
      const uint32_t mask = 0u - (crc & 1u);
      crc = (crc >> 1) ^ (CRC32_POLY & mask);
    }
  }

  return crc;
}

}  // namespace internal
}  // namespace link
}  // namespace probe
