/**
 * @file crc8.cpp
 * @brief Frame checksum implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "crc8.hpp"

#include "probelink/protocol.hpp"

namespace probe
{
namespace link
{
namespace internal
{

uint8_t update_crc8(uint8_t crc, const uint8_t* data, size_t len)
{
  for (size_t i = 0; i < len; ++i)
  {
    crc ^= data[i];

    for (int bit = 0; bit < 8; ++bit)
    {
      crc = (crc & 0x80) ? static_cast<uint8_t>((crc << 1) ^ CRC8_POLY)
                         : static_cast<uint8_t>(crc << 1);
    }
  }

  return crc;
}

}  // namespace internal
}  // namespace link
}  // namespace probe
