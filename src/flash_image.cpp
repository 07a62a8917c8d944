/**
 * @file flash_image.cpp
 * @brief Flash section extraction
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "probelink/flash_image.hpp"

#include <elf.h>

#include <algorithm>

#include "crc32.hpp"
#include "probelink/internal/elf_reader.hpp"
#include "probelink/log.hpp"

namespace probe
{
namespace link
{

namespace
{

void sort_by_address(std::vector<FlashSection>& sections)
{
  std::stable_sort(sections.begin(), sections.end(),
                   [](const FlashSection& a, const FlashSection& b)
                   { return a.address < b.address; });
}

}  // namespace

FlashImage::FlashImage(std::vector<FlashSection> sections, uint32_t entry_point)
    : sections_(std::move(sections)), entry_point_(entry_point)
{
  sort_by_address(sections_);
}

bool FlashImage::is_flash_section(const SectionHeader& header, const TargetProfile& profile)
{
  if ((header.flags & SHF_ALLOC) == 0)
  {
    return false;
  }

  // .bss and friends occupy no file space
  if (header.type == SHT_NOBITS)
  {
    return false;
  }

  return profile.in_flash(header.address);
}

ErrorCode FlashImage::from_sections(const ImageInfo& info, const std::vector<uint8_t>& image,
                                    const TargetProfile& profile, FlashImage& out)
{
  std::vector<FlashSection> sections;

  for (const SectionHeader& header : info.sections)
  {
    if (!is_flash_section(header, profile))
    {
      continue;
    }

    const uint64_t end = static_cast<uint64_t>(header.offset) + header.size;
    if (end > image.size())
    {
      PROBELINK_LOG_E("section at 0x%08X: data [0x%X, 0x%llX) extends beyond image (%zu bytes)",
                      header.address, header.offset, static_cast<unsigned long long>(end),
                      image.size());
      return ErrorCode::SECTION_OUT_OF_RANGE;
    }

    FlashSection section;
    section.address = header.address;
    section.size = header.size;
    section.data.assign(image.begin() + header.offset, image.begin() + header.offset + header.size);
    sections.push_back(std::move(section));
  }

  out = FlashImage(std::move(sections), info.entry_point);

  PROBELINK_LOG_I("%zu flash sections, entry point 0x%08X", out.sections_.size(),
                  out.entry_point_);
  return ErrorCode::OK;
}

ErrorCode FlashImage::from_elf(const std::vector<uint8_t>& image, const TargetProfile& profile,
                               FlashImage& out)
{
  ImageInfo info;
  const ErrorCode err = internal::read_elf32_sections(image.data(), image.size(), info);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return from_sections(info, image, profile, out);
}

ErrorCode FlashImage::from_elf_file(const std::string& path, const TargetProfile& profile,
                                    FlashImage& out)
{
  std::vector<uint8_t> image;
  const ErrorCode err = internal::load_file(path, image);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return from_elf(image, profile, out);
}

std::vector<std::pair<uint32_t, uint32_t>> FlashImage::memory_map() const
{
  std::vector<std::pair<uint32_t, uint32_t>> map;
  map.reserve(sections_.size());

  for (const FlashSection& section : sections_)
  {
    if (section.size == 0)
    {
      continue;
    }
    map.emplace_back(section.address, section.address + section.size - 1);
  }

  return map;
}

uint32_t FlashImage::checksum() const
{
  uint32_t crc = CRC32_INIT;

  for (const FlashSection& section : sections_)
  {
    const uint8_t address[4] = {
        static_cast<uint8_t>(section.address & 0xFF),
        static_cast<uint8_t>((section.address >> 8) & 0xFF),
        static_cast<uint8_t>((section.address >> 16) & 0xFF),
        static_cast<uint8_t>((section.address >> 24) & 0xFF),
    };
    crc = internal::update_crc32(crc, address, sizeof(address));
    crc = internal::update_crc32(crc, section.data.data(), section.data.size());
  }

  return crc;
}

}  // namespace link
}  // namespace probe
