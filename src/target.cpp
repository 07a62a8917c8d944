/**
 * @file target.cpp
 * @brief Built-in target profiles
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "probelink/target.hpp"

namespace probe
{
namespace link
{

bool TargetProfile::in_flash(uint32_t address) const
{
  for (const AddressWindow& window : flash_windows)
  {
    if (window.contains(address))
    {
      return true;
    }
  }
  return false;
}

const TargetProfile& mspm0g3507_profile()
{
  static const TargetProfile profile{
      "MSPM0G3507",
      {
          {0x00000000, 0x00020000},  // main flash
          {0x41C00000, 0x41C00400},  // NONMAIN info flash
      },
      0xE000EDF4,  // DCRSR
      0xE000EDF8,  // DCRDR
      15,
      4,
      0xFF,
  };
  return profile;
}

}  // namespace link
}  // namespace probe
