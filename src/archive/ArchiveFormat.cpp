/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "archive/ArchiveFormat.hpp"
#include <zlib.h>

namespace DexVault::ArchiveFormat {

uint32_t computeChecksum(const uint8_t *data, size_t size) {
  constexpr size_t afterChecksum = CHECKSUM_OFFSET + sizeof(uint32_t);

  uLong crc = crc32_z(0L, Z_NULL, 0);
  crc = crc32_z(crc, data, CHECKSUM_OFFSET);
  if (size > afterChecksum) {
    crc = crc32_z(crc, data + afterChecksum, size - afterChecksum);
  }
  return static_cast<uint32_t>(crc);
}

} // namespace DexVault::ArchiveFormat
