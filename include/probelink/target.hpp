/**
 * @file target.hpp
 * @brief Target device description
 *
 * Everything that ties probelink to one particular microcontroller lives in
 * a TargetProfile. Supporting another part means supplying another profile.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace probe
{
namespace link
{

/**
 * @brief Half-open address range [start, end)
 */
struct AddressWindow
{
  uint32_t start;
  uint32_t end;

  bool contains(uint32_t address) const
  {
    return address >= start && address < end;
  }
};

/**
 * @brief Memory layout and debug registers of a target device
 */
struct TargetProfile
{
  std::string name;

  /// Ranges treated as non-volatile memory during verification
  std::vector<AddressWindow> flash_windows;

  /// Debug Core Register Selector (DCRSR)
  uint32_t debug_select_address;

  /// Debug Core Register Data (DCRDR)
  uint32_t debug_data_address;

  /// Core register index aliased to the program counter
  uint8_t pc_register;

  /// Largest read the probe firmware answers in one request
  uint32_t max_read_chunk;

  /// Value used to pad short read-backs
  uint8_t fill_byte;

  /**
   * @brief Check whether @p address lies in any flash window
   */
  bool in_flash(uint32_t address) const;
};

/**
 * @brief TI MSPM0G3507: 128 KiB main flash plus 1 KiB info flash
 */
const TargetProfile& mspm0g3507_profile();

}  // namespace link
}  // namespace probe
