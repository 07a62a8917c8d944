/**
 * @file verifier.cpp
 * @brief Flash read-back verification implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "probelink/verifier.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstdio>

#include "probelink/log.hpp"
#include "probelink/session.hpp"

namespace probe
{
namespace link
{

namespace
{

#if defined(__GNUC__)
__attribute__((format(printf, 2, 3)))
#endif
void append_format(std::string& out, const char* fmt, ...)
{
  char line[256];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(line, sizeof(line), fmt, args);
  va_end(args);
  out += line;
}

}  // namespace

FlashVerifier::FlashVerifier(FlashImage image, const TargetProfile& profile)
    : image_(std::move(image)),
      chunk_size_(std::max<uint32_t>(profile.max_read_chunk, 1)),
      fill_byte_(profile.fill_byte)
{
}

VerificationResult FlashVerifier::verify(const ReadFlashFn& read_flash) const
{
  VerificationResult result;
  result.total_sections = image_.sections().size();

  for (const FlashSection& section : image_.sections())
  {
    PROBELINK_LOG_I("verifying section at 0x%08X, size: %u bytes", section.address,
                    section.size);

    std::vector<uint8_t> flash_data;
    flash_data.reserve(section.size);

    uint32_t current = section.address;
    uint32_t remaining = section.size;
    std::vector<uint8_t> chunk;

    while (remaining > 0)
    {
      const uint32_t chunk_size = std::min(remaining, chunk_size_);

      chunk.clear();
      const ErrorCode err = read_flash(current, chunk_size, chunk);
      if (err != ErrorCode::OK)
      {
        std::string message;
        append_format(message, "Failed to read flash at 0x%08X: %s", current,
                      error_message(err));
        PROBELINK_LOG_E("%s", message.c_str());
        result.errors.push_back(std::move(message));
        return result;
      }

      chunk.resize(chunk_size, fill_byte_);
      flash_data.insert(flash_data.end(), chunk.begin(), chunk.end());

      current += chunk_size;
      remaining -= chunk_size;
    }

    if (flash_data.size() != section.data.size())
    {
      std::string message;
      append_format(message,
                    "Size mismatch in section at 0x%08X: expected %zu bytes, got %zu bytes",
                    section.address, section.data.size(), flash_data.size());
      PROBELINK_LOG_W("%s", message.c_str());
      result.errors.push_back(std::move(message));
      continue;
    }

    std::vector<ByteMismatch> mismatches;
    for (size_t i = 0; i < section.data.size(); ++i)
    {
      if (section.data[i] != flash_data[i])
      {
        mismatches.push_back(ByteMismatch{section.address + static_cast<uint32_t>(i),
                                          section.data[i], flash_data[i]});
      }
    }

    if (mismatches.empty())
    {
      result.verified_sections.push_back(section.address);
      PROBELINK_LOG_I("section at 0x%08X verified", section.address);
    }
    else
    {
      PROBELINK_LOG_W("section at 0x%08X has %zu mismatches", section.address,
                      mismatches.size());
      result.mismatched_sections.emplace(section.address, std::move(mismatches));
    }
  }

  return result;
}

ReadFlashFn make_session_reader(Session& session)
{
  return [&session](uint32_t address, uint32_t length, std::vector<uint8_t>& out)
  { return session.read_bytes(address, length, out); };
}

std::string format_report(const VerificationResult& result, size_t max_shown)
{
  std::string out;

  out += "=== Flash Verification Report ===\n";
  append_format(out, "Total sections: %zu\n", result.total_sections);
  append_format(out, "Verified sections: %zu\n", result.verified_sections.size());
  append_format(out, "Failed sections: %zu\n", result.mismatched_sections.size());

  if (!result.errors.empty())
  {
    out += "\nErrors:\n";
    for (const std::string& error : result.errors)
    {
      out += "  - ";
      out += error;
      out += '\n';
    }
  }

  if (!result.mismatched_sections.empty())
  {
    out += "\nMismatched Sections:\n";
    for (const auto& entry : result.mismatched_sections)
    {
      const std::vector<ByteMismatch>& mismatches = entry.second;
      append_format(out, "  Section 0x%08X: %zu mismatches\n", entry.first, mismatches.size());

      const size_t shown = std::min(mismatches.size(), max_shown);
      for (size_t i = 0; i < shown; ++i)
      {
        append_format(out, "    0x%08X: expected 0x%02X, got 0x%02X\n", mismatches[i].address,
                      mismatches[i].expected, mismatches[i].actual);
      }

      if (mismatches.size() > shown)
      {
        append_format(out, "    ... and %zu more\n", mismatches.size() - shown);
      }
    }
  }

  append_format(out, "\nOverall result: %s\n", result.success() ? "PASS" : "FAIL");
  return out;
}

}  // namespace link
}  // namespace probe
