/**
 * @file elf_reader.hpp
 * @brief Minimal ELF32 section table reader (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "probelink/flash_image.hpp"

namespace probe::link::internal
{

/**
 * @brief Read the section table of a little-endian ELF32 image
 *
 * Only the header fields needed to locate section data are decoded.
 *
 * @param image Image bytes
 * @param size  Image length in bytes
 * @param info  Receives entry point and section headers
 * @return OK, or INVALID_IMAGE when the buffer is not a little-endian ELF32
 *         file or its section table lies outside the buffer
 */
ErrorCode read_elf32_sections(const uint8_t* image, size_t size, ImageInfo& info);

/**
 * @brief Read a whole file into memory
 *
 * @return OK or IO_ERROR
 */
ErrorCode load_file(const std::string& path, std::vector<uint8_t>& out);

}  // namespace probe::link::internal
