/**
 * @file elf_reader.cpp
 * @brief Minimal ELF32 section table reader
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "probelink/internal/elf_reader.hpp"

#include <elf.h>

#include <cstddef>
#include <cstring>
#include <fstream>
#include <iterator>

#include "probelink/log.hpp"

namespace probe::link::internal
{

namespace
{

uint16_t get_u16_le(const uint8_t* p)
{
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t get_u32_le(const uint8_t* p)
{
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

bool table_fits(uint64_t offset, uint64_t count, uint64_t entry_size, size_t size)
{
  return offset + count * entry_size <= size;
}

}  // namespace

ErrorCode read_elf32_sections(const uint8_t* image, size_t size, ImageInfo& info)
{
  if (size < sizeof(Elf32_Ehdr) || std::memcmp(image, ELFMAG, SELFMAG) != 0)
  {
    PROBELINK_LOG_E("image is not an ELF file");
    return ErrorCode::INVALID_IMAGE;
  }

  if (image[EI_CLASS] != ELFCLASS32 || image[EI_DATA] != ELFDATA2LSB)
  {
    PROBELINK_LOG_E("only little-endian ELF32 images are supported");
    return ErrorCode::INVALID_IMAGE;
  }

  const uint32_t entry = get_u32_le(image + offsetof(Elf32_Ehdr, e_entry));
  const uint32_t shoff = get_u32_le(image + offsetof(Elf32_Ehdr, e_shoff));
  const uint16_t shentsize = get_u16_le(image + offsetof(Elf32_Ehdr, e_shentsize));
  uint32_t shnum = get_u16_le(image + offsetof(Elf32_Ehdr, e_shnum));

  info.entry_point = entry;
  info.sections.clear();

  if (shoff == 0)
  {
    // No section table
    return ErrorCode::OK;
  }

  if (shentsize < sizeof(Elf32_Shdr) || !table_fits(shoff, 1, shentsize, size))
  {
    PROBELINK_LOG_E("section table at 0x%X is malformed", shoff);
    return ErrorCode::INVALID_IMAGE;
  }

  if (shnum == 0)
  {
    // Extended numbering: the real count sits in sh_size of entry 0
    shnum = get_u32_le(image + shoff + offsetof(Elf32_Shdr, sh_size));
  }

  if (!table_fits(shoff, shnum, shentsize, size))
  {
    PROBELINK_LOG_E("section table (%u entries) extends beyond image", shnum);
    return ErrorCode::INVALID_IMAGE;
  }

  info.sections.reserve(shnum);
  for (uint32_t i = 0; i < shnum; ++i)
  {
    const uint8_t* sh = image + shoff + static_cast<size_t>(i) * shentsize;

    SectionHeader header;
    header.address = get_u32_le(sh + offsetof(Elf32_Shdr, sh_addr));
    header.size = get_u32_le(sh + offsetof(Elf32_Shdr, sh_size));
    header.type = get_u32_le(sh + offsetof(Elf32_Shdr, sh_type));
    header.flags = get_u32_le(sh + offsetof(Elf32_Shdr, sh_flags));
    header.offset = get_u32_le(sh + offsetof(Elf32_Shdr, sh_offset));
    info.sections.push_back(header);
  }

  return ErrorCode::OK;
}

ErrorCode load_file(const std::string& path, std::vector<uint8_t>& out)
{
  std::ifstream file(path, std::ios::binary);
  if (!file)
  {
    PROBELINK_LOG_E("cannot open %s", path.c_str());
    return ErrorCode::IO_ERROR;
  }

  out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad())
  {
    PROBELINK_LOG_E("cannot read %s", path.c_str());
    return ErrorCode::IO_ERROR;
  }

  return ErrorCode::OK;
}

}  // namespace probe::link::internal
