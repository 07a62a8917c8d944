/**
 * @file flash_image.hpp
 * @brief Flash contents expected from a program image
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "probelink/protocol.hpp"
#include "probelink/target.hpp"

namespace probe
{
namespace link
{

/**
 * @brief One entry of a program image section table
 *
 * @c type and @c flags carry ELF SHT_* and SHF_* values.
 */
struct SectionHeader
{
  uint32_t address;  ///< Load address
  uint32_t size;     ///< Size in bytes
  uint32_t type;     ///< SHT_PROGBITS, SHT_NOBITS, ...
  uint32_t flags;    ///< SHF_ALLOC, SHF_EXECINSTR, ...
  uint32_t offset;   ///< Offset of the section data in the image file
};

/**
 * @brief Parsed view of a program image
 */
struct ImageInfo
{
  uint32_t entry_point = 0;
  std::vector<SectionHeader> sections;
};

/**
 * @brief Bytes a flash region must contain
 */
struct FlashSection
{
  uint32_t address;
  uint32_t size;
  std::vector<uint8_t> data;
};

/**
 * @brief Flash-resident sections of a program image, sorted by address
 */
class FlashImage
{
 public:
  FlashImage() : entry_point_(0)
  {
  }

  /**
   * @brief Build from already extracted sections (sorted on construction)
   */
  FlashImage(std::vector<FlashSection> sections, uint32_t entry_point);

  /**
   * @brief Select and extract the flash sections of an image
   *
   * A section is kept when it is allocatable, occupies file space (not
   * SHT_NOBITS) and its address lies in one of the profile's flash windows.
   *
   * @param info    Section table and entry point
   * @param image   Raw image file bytes
   * @param profile Target description
   * @param out     Receives the flash image
   * @return OK, or SECTION_OUT_OF_RANGE if a selected section extends past
   *         the end of @p image
   */
  static ErrorCode from_sections(const ImageInfo& info, const std::vector<uint8_t>& image,
                                 const TargetProfile& profile, FlashImage& out);

  /**
   * @brief Parse an ELF32 image held in memory
   *
   * @return OK, INVALID_IMAGE or SECTION_OUT_OF_RANGE
   */
  static ErrorCode from_elf(const std::vector<uint8_t>& image, const TargetProfile& profile,
                            FlashImage& out);

  /**
   * @brief Load and parse an ELF32 file
   *
   * @return OK, IO_ERROR, INVALID_IMAGE or SECTION_OUT_OF_RANGE
   */
  static ErrorCode from_elf_file(const std::string& path, const TargetProfile& profile,
                                 FlashImage& out);

  /**
   * @brief Section selection rule used by from_sections()
   */
  static bool is_flash_section(const SectionHeader& header, const TargetProfile& profile);

  const std::vector<FlashSection>& sections() const
  {
    return sections_;
  }

  uint32_t entry_point() const
  {
    return entry_point_;
  }

  /**
   * @brief (start, inclusive end) of every non-empty section, by address
   */
  std::vector<std::pair<uint32_t, uint32_t>> memory_map() const;

  /**
   * @brief Whole-image digest
   *
   * Block checksum fed, in address order, with each section's address
   * (little-endian) followed by its bytes.
   */
  uint32_t checksum() const;

 private:
  std::vector<FlashSection> sections_;
  uint32_t entry_point_;
};

}  // namespace link
}  // namespace probe
