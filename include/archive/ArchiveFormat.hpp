/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * On-disk layout of the species archive (species.dexv)
 *
 *   [FileHeader]                     80 bytes at offset 0
 *   [index section]                  at header.indexOffset
 *     IndexHeader
 *     IndexBucket[TYPE_TAG_COUNT]    type tag   -> slice of the id pool
 *     IndexBucket[GENERATION_COUNT]  generation -> slice of the id pool
 *     int32_t idPool[]               each slice sorted ascending
 *     IdLookupEntry[recordCount]     sorted by id, for binary search
 *     uint32_t recordOffsets[]       stored order, relative to record section
 *   [record section]                 at header.recordOffset, 8-byte aligned
 *     RecordHeader + tables + string bytes, one block per record
 *
 * All integers are little-endian host order. Offsets inside a record are
 * relative to the start of that record. The CRC-32 covers the whole file
 * except the checksum field itself.
 */

#ifndef ARCHIVE_FORMAT_HPP
#define ARCHIVE_FORMAT_HPP

#include "entities/SpeciesRecord.hpp"
#include <cstddef>
#include <cstdint>

namespace DexVault::ArchiveFormat {

inline constexpr char MAGIC[8] = {'D', 'E', 'X', 'V', 'A', 'U', 'L', 'T'};
inline constexpr uint16_t VERSION_MAJOR = 1;
inline constexpr uint16_t VERSION_MINOR = 0;
inline constexpr size_t RECORD_ALIGNMENT = 8;

inline constexpr uint16_t RECORD_FLAG_HAS_FLAVOR = 0x0001;

#pragma pack(push, 1)

struct FileHeader {
  char magic[8];          //  0: "DEXVAULT"
  uint16_t versionMajor;  //  8
  uint16_t versionMinor;  // 10
  uint32_t headerSize;    // 12
  uint32_t recordCount;   // 16
  uint32_t flags;         // 20
  int64_t builtAt;        // 24: seconds since the Unix epoch
  uint64_t indexOffset;   // 32
  uint64_t indexLength;   // 40
  uint64_t recordOffset;  // 48
  uint64_t recordLength;  // 56
  uint64_t fileSize;      // 64
  uint32_t reserved;      // 72
  uint32_t checksum;      // 76: CRC-32 of everything but these 4 bytes
};                        // 80

struct IndexHeader {
  uint32_t typeBucketCount;       //  0
  uint32_t generationBucketCount; //  4
  uint32_t idPoolOffset;          //  8: relative to index section
  uint32_t idPoolCount;           // 12
  uint32_t lookupOffset;          // 16: relative to index section
  uint32_t orderOffset;           // 20: relative to index section
  uint32_t reserved[2];           // 24
};                                // 32

struct IndexBucket {
  uint32_t first; //  0: first slot in the id pool
  uint32_t count; //  4
};                //  8

struct IdLookupEntry {
  int32_t id;       //  0
  uint32_t ordinal; //  4: position in stored order
};                  //  8

struct StrRef {
  uint32_t offset; //  0
  uint32_t length; //  4
};                 //  8

struct ListRef {
  uint32_t offset; //  0
  uint32_t count;  //  4
};                 //  8

struct RecordHeader {
  uint32_t recordSize;                  //  0: bytes including padding
  int32_t id;                           //  4
  int32_t height;                       //  8
  int32_t weight;                       // 12
  int32_t stats[STAT_COUNT];            // 16: StatKind order
  uint8_t generation;                   // 40
  uint8_t typeCount;                    // 41
  uint8_t types[MAX_TYPES_PER_RECORD];  // 42
  uint16_t flags;                       // 46
  StrRef name;                          // 48
  StrRef flavorText;                    // 56
  StrRef spriteUrl;                     // 64
  ListRef abilities;                    // 72: StrRef[count]
  ListRef evolutions;                   // 80: EvolutionEntry[count]
  ListRef encounters;                   // 88: EncounterEntry[count]
};                                      // 96

struct EvolutionEntry {
  int32_t speciesId;  //  0
  StrRef requirement; //  4
};                    // 12

struct EncounterEntry {
  StrRef game;       //  0
  ListRef locations; //  8: StrRef[count]
};                   // 16

#pragma pack(pop)

static_assert(sizeof(FileHeader) == 80, "FileHeader must be 80 bytes");
static_assert(sizeof(IndexHeader) == 32, "IndexHeader must be 32 bytes");
static_assert(sizeof(IndexBucket) == 8, "IndexBucket must be 8 bytes");
static_assert(sizeof(IdLookupEntry) == 8, "IdLookupEntry must be 8 bytes");
static_assert(sizeof(StrRef) == 8, "StrRef must be 8 bytes");
static_assert(sizeof(ListRef) == 8, "ListRef must be 8 bytes");
static_assert(sizeof(RecordHeader) == 96, "RecordHeader must be 96 bytes");
static_assert(sizeof(EvolutionEntry) == 12, "EvolutionEntry must be 12 bytes");
static_assert(sizeof(EncounterEntry) == 16, "EncounterEntry must be 16 bytes");

inline constexpr size_t CHECKSUM_OFFSET = offsetof(FileHeader, checksum);

/**
 * @brief CRC-32 (zlib) over the whole image except the checksum field
 * @param data start of the file image
 * @param size image size, at least sizeof(FileHeader)
 */
uint32_t computeChecksum(const uint8_t *data, size_t size);

} // namespace DexVault::ArchiveFormat

#endif // ARCHIVE_FORMAT_HPP
