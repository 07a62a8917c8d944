/**
 * @file verifier.hpp
 * @brief Flash read-back verification
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "probelink/flash_image.hpp"
#include "probelink/protocol.hpp"
#include "probelink/target.hpp"

namespace probe
{
namespace link
{

class Session;

/**
 * @brief One differing byte
 */
struct ByteMismatch
{
  uint32_t address;
  uint8_t expected;
  uint8_t actual;
};

/**
 * @brief Outcome of one verification run
 */
struct VerificationResult
{
  /// Number of sections in the image
  size_t total_sections = 0;

  /// Base addresses of sections that matched, in address order
  std::vector<uint32_t> verified_sections;

  /// Every mismatch, keyed by section base address, in offset order
  std::map<uint32_t, std::vector<ByteMismatch>> mismatched_sections;

  /// Read failures and size mismatches
  std::vector<std::string> errors;

  /**
   * @brief True iff nothing failed and nothing differed
   */
  bool success() const
  {
    return errors.empty() && mismatched_sections.empty();
  }
};

/**
 * @brief Read-back function type
 *
 * @param address Start address
 * @param length  Byte count, at most the profile's max_read_chunk
 * @param out     Bytes read; fewer than @p length are padded by the caller
 * @return ErrorCode::OK or the reason the read failed
 */
using ReadFlashFn = std::function<ErrorCode(uint32_t address, uint32_t length,
                                            std::vector<uint8_t>& out)>;

/**
 * @brief Compares target flash against a FlashImage
 */
class FlashVerifier
{
 public:
  /**
   * @param image   Expected contents
   * @param profile Supplies the per-request read ceiling and pad byte
   */
  explicit FlashVerifier(FlashImage image, const TargetProfile& profile = mspm0g3507_profile());

  /**
   * @brief Read back every section and compare
   *
   * Sections are processed in address order. A read error aborts the whole
   * run and the partial result is returned. A size mismatch is recorded and
   * the run continues with the next section.
   */
  VerificationResult verify(const ReadFlashFn& read_flash) const;

  const FlashImage& image() const
  {
    return image_;
  }

 private:
  FlashImage image_;
  uint32_t chunk_size_;
  uint8_t fill_byte_;
};

/**
 * @brief Adapt a session into a read-back function
 *
 * The session must outlive the returned function.
 */
ReadFlashFn make_session_reader(Session& session);

/**
 * @brief Render a human-readable report
 *
 * Lists counts, all errors and, per failed section, the first @p max_shown
 * mismatches followed by "... and N more".
 */
std::string format_report(const VerificationResult& result, size_t max_shown = 5);

}  // namespace link
}  // namespace probe
