/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ArchiveStoreTests
#include <boost/test/unit_test.hpp>

#include "archive/ArchiveBuilder.hpp"
#include "archive/ArchiveFormat.hpp"
#include "archive/ArchiveStore.hpp"
#include "core/Logger.hpp"
#include "mocks/SpeciesFixtures.hpp"
#include "mocks/TempCacheDirectory.hpp"
#include <cstring>

using namespace DexVault;

namespace {

constexpr int64_t BUILT_AT = 1700000000;

void rewriteChecksum(std::vector<uint8_t>& image) {
    uint32_t checksum = ArchiveFormat::computeChecksum(image.data(), image.size());
    std::memcpy(image.data() + ArchiveFormat::CHECKSUM_OFFSET, &checksum, sizeof(checksum));
}

size_t firstRecordOffset(const std::vector<uint8_t>& image) {
    ArchiveFormat::FileHeader header;
    std::memcpy(&header, image.data(), sizeof(header));
    const uint64_t recordOffset = header.recordOffset;
    return static_cast<size_t>(recordOffset);
}

} // namespace

struct ArchiveStoreFixture {
    TempCacheDirectory dir{"dexvault_store"};
    std::filesystem::path path;
    std::vector<SpeciesRecord> records;

    ArchiveStoreFixture() {
        DEXVAULT_ENABLE_SILENT_MODE();
        path = dir / "species.dexv";
        records = Fixtures::expectedRecords(Fixtures::starterFixtures());
        BOOST_REQUIRE(ArchiveBuilder::writeArchive(records, path, BUILT_AT).status == BuildStatus::Ok);
    }

    std::vector<uint8_t> image() const { return TempCacheDirectory::readFile(path); }

    ArchiveStatus openTampered(const std::vector<uint8_t>& bytes, ArchiveStore& store) const {
        auto tampered = dir / "tampered.dexv";
        TempCacheDirectory::writeFile(tampered, bytes);
        return store.open(tampered);
    }
};

BOOST_FIXTURE_TEST_SUITE(ArchiveStoreTestSuite, ArchiveStoreFixture)

BOOST_AUTO_TEST_CASE(TestMissingArchive) {
    ArchiveStore store;
    BOOST_CHECK(store.open(dir / "nothing_here.dexv") == ArchiveStatus::Missing);
    BOOST_CHECK(!store.isOpen());
    BOOST_CHECK_EQUAL(store.count(), 0u);
    BOOST_CHECK(!store.get(1).has_value());
    BOOST_CHECK(store.filter(SpeciesFilter{}).empty());
}

BOOST_AUTO_TEST_CASE(TestOpenReportsMetadata) {
    ArchiveStore store;
    BOOST_REQUIRE(store.open(path) == ArchiveStatus::Ok);
    BOOST_CHECK(store.isOpen());
    BOOST_CHECK_EQUAL(store.count(), records.size());
    BOOST_CHECK_EQUAL(store.builtAt(), BUILT_AT);
    BOOST_CHECK_EQUAL(store.path(), path);
    BOOST_CHECK_EQUAL(store.fileSize(), std::filesystem::file_size(path));
    BOOST_CHECK(store.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestGetById) {
    ArchiveStore store;
    BOOST_REQUIRE(store.open(path) == ArchiveStatus::Ok);

    auto charizard = store.get(6);
    BOOST_REQUIRE(charizard.has_value());
    BOOST_CHECK_EQUAL(std::string(charizard->name()), "charizard");
    BOOST_CHECK(charizard->hasType(TypeTag::Fire));
    BOOST_CHECK(charizard->hasType(TypeTag::Flying));
    BOOST_CHECK(!charizard->hasType(TypeTag::Water));
    BOOST_CHECK_EQUAL(charizard->stat(StatKind::SpecialAttack), 109);
    BOOST_CHECK_EQUAL(charizard->totalStats(), 534);
    BOOST_CHECK(charizard->generation() == Generation::I);

    BOOST_REQUIRE_EQUAL(charizard->evolutions().size(), 3u);
    BOOST_CHECK_EQUAL(charizard->evolutions()[0].speciesId, 4);
    BOOST_CHECK(charizard->evolutions()[0].requirement.empty());
    BOOST_CHECK_EQUAL(std::string(charizard->evolutions()[2].requirement), "Level 36");

    BOOST_REQUIRE_EQUAL(charizard->encounters().size(), 2u);
    BOOST_CHECK_EQUAL(std::string(charizard->encounters()[0].game), "Red");
    BOOST_CHECK_EQUAL(std::string(charizard->encounters()[0].locations[0]), "Route 6 Area (Walk)");

    BOOST_CHECK(!store.get(3).has_value());
    BOOST_CHECK(!store.get(-1).has_value());
    BOOST_CHECK(!store.get(100000).has_value());
}

BOOST_AUTO_TEST_CASE(TestIterateAndPageFollowStoredOrder) {
    ArchiveStore store;
    BOOST_REQUIRE(store.open(path) == ArchiveStatus::Ok);

    std::vector<int32_t> ids;
    for (const SpeciesView& view : store.iterate()) {
        ids.push_back(view.id());
    }
    BOOST_REQUIRE_EQUAL(ids.size(), records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        BOOST_CHECK_EQUAL(ids[i], records[i].id);
    }

    auto first = store.page(0, 3);
    BOOST_REQUIRE_EQUAL(first.size(), 3u);
    BOOST_CHECK_EQUAL(first[2].id(), records[2].id);

    auto tail = store.page(records.size() - 2, 10);
    BOOST_REQUIRE_EQUAL(tail.size(), 2u);
    BOOST_CHECK_EQUAL(tail[1].id(), records.back().id);

    BOOST_CHECK(store.page(records.size(), 1).empty());
    BOOST_CHECK(store.page(1000, 5).empty());
    BOOST_CHECK(store.page(0, 0).empty());
}

BOOST_AUTO_TEST_CASE(TestSearchIsCaseInsensitive) {
    ArchiveStore store;
    BOOST_REQUIRE(store.open(path) == ArchiveStatus::Ok);

    auto saurs = store.search("SAUR");
    BOOST_REQUIRE_EQUAL(saurs.size(), 2u);
    BOOST_CHECK_EQUAL(std::string(saurs[0].name()), "bulbasaur");
    BOOST_CHECK_EQUAL(std::string(saurs[1].name()), "ivysaur");

    BOOST_CHECK_EQUAL(store.search("").size(), records.size());
    BOOST_CHECK(store.search("missingno").empty());
}

BOOST_AUTO_TEST_CASE(TestChecksumDetectsFlippedByte) {
    auto bytes = image();
    bytes[bytes.size() - 3] ^= 0x5A;

    ArchiveStore store;
    BOOST_CHECK(openTampered(bytes, store) == ArchiveStatus::Corrupt);
    BOOST_CHECK(!store.isOpen());
    BOOST_CHECK(!store.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestEveryFlippedByteIsCorrupt) {
    // Single record with evolution and encounter lists keeps the sweep short
    auto small = dir / "small.dexv";
    BOOST_REQUIRE(ArchiveBuilder::writeArchive({records[3]}, small, BUILT_AT).status == BuildStatus::Ok);
    const auto original = TempCacheDirectory::readFile(small);
    BOOST_REQUIRE_GT(original.size(), sizeof(ArchiveFormat::FileHeader));

    {
        ArchiveStore store;
        BOOST_REQUIRE(openTampered(original, store) == ArchiveStatus::Ok);
    }

    std::vector<size_t> accepted;
    for (uint8_t mask : {uint8_t{0x01}, uint8_t{0xFF}}) {
        for (size_t offset = 0; offset < original.size(); ++offset) {
            auto bytes = original;
            bytes[offset] ^= mask;

            ArchiveStore store;
            if (openTampered(bytes, store) != ArchiveStatus::Corrupt || store.isOpen()) {
                accepted.push_back(offset);
            }
        }
    }
    BOOST_CHECK_MESSAGE(accepted.empty(), accepted.size() << " flipped offsets were not reported Corrupt, first at "
                                                          << (accepted.empty() ? 0 : accepted.front()));
}

BOOST_AUTO_TEST_CASE(TestBadMagicTruncationAndEmptyFile) {
    ArchiveStore store;

    auto badMagic = image();
    badMagic[0] = 'X';
    BOOST_CHECK(openTampered(badMagic, store) == ArchiveStatus::Corrupt);

    auto truncated = image();
    truncated.pop_back();
    BOOST_CHECK(openTampered(truncated, store) == ArchiveStatus::Corrupt);

    auto header = image();
    header.resize(40);
    BOOST_CHECK(openTampered(header, store) == ArchiveStatus::Corrupt);

    BOOST_CHECK(openTampered({}, store) == ArchiveStatus::Corrupt);
}

BOOST_AUTO_TEST_CASE(TestVersionMismatchIsCorrupt) {
    auto bytes = image();
    uint16_t major = ArchiveFormat::VERSION_MAJOR + 1;
    std::memcpy(bytes.data() + offsetof(ArchiveFormat::FileHeader, versionMajor), &major, sizeof(major));
    rewriteChecksum(bytes);

    ArchiveStore store;
    BOOST_CHECK(openTampered(bytes, store) == ArchiveStatus::Corrupt);
    BOOST_CHECK(store.getLastError().find("version") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestRecordIdMismatchIsCorrupt) {
    // Valid checksum, but the record no longer matches the id lookup
    auto bytes = image();
    int32_t bogusId = 9999;
    std::memcpy(bytes.data() + firstRecordOffset(bytes) + offsetof(ArchiveFormat::RecordHeader, id),
                &bogusId, sizeof(bogusId));
    rewriteChecksum(bytes);

    ArchiveStore store;
    BOOST_CHECK(openTampered(bytes, store) == ArchiveStatus::Corrupt);
}

BOOST_AUTO_TEST_CASE(TestRecordOutsideItsBucketIsCorrupt) {
    // Bulbasaur is indexed as grass; relabel its first type as fire
    auto bytes = image();
    bytes[firstRecordOffset(bytes) + offsetof(ArchiveFormat::RecordHeader, types)] =
        static_cast<uint8_t>(TypeTag::Fire);
    rewriteChecksum(bytes);

    ArchiveStore store;
    BOOST_CHECK(openTampered(bytes, store) == ArchiveStatus::Corrupt);
}

BOOST_AUTO_TEST_CASE(TestStringOutOfBoundsIsCorrupt) {
    auto bytes = image();
    uint32_t hugeLength = 1u << 30;
    std::memcpy(bytes.data() + firstRecordOffset(bytes) + offsetof(ArchiveFormat::RecordHeader, name) +
                    offsetof(ArchiveFormat::StrRef, length),
                &hugeLength, sizeof(hugeLength));
    rewriteChecksum(bytes);

    ArchiveStore store;
    BOOST_CHECK(openTampered(bytes, store) == ArchiveStatus::Corrupt);
}

BOOST_AUTO_TEST_CASE(TestFailedOpenClosesPreviousArchive) {
    ArchiveStore store;
    BOOST_REQUIRE(store.open(path) == ArchiveStatus::Ok);

    auto bytes = image();
    bytes[bytes.size() / 2] ^= 0xFF;
    BOOST_CHECK(openTampered(bytes, store) == ArchiveStatus::Corrupt);
    BOOST_CHECK(!store.isOpen());
    BOOST_CHECK(!store.get(1).has_value());

    BOOST_CHECK(store.open(path) == ArchiveStatus::Ok);
    BOOST_CHECK(store.get(1).has_value());
}

BOOST_AUTO_TEST_CASE(TestDirectoryIsNotAnArchive) {
    ArchiveStore store;
    ArchiveStatus status = store.open(dir.path());
    BOOST_CHECK(status == ArchiveStatus::IoError || status == ArchiveStatus::Corrupt);
    BOOST_CHECK(!store.isOpen());
}

BOOST_AUTO_TEST_CASE(TestStatusNames) {
    BOOST_CHECK_EQUAL(std::string(archiveStatusName(ArchiveStatus::Ok)), "Ok");
    BOOST_CHECK_EQUAL(std::string(archiveStatusName(ArchiveStatus::Missing)), "Missing");
    BOOST_CHECK_EQUAL(std::string(archiveStatusName(ArchiveStatus::Corrupt)), "Corrupt");
    BOOST_CHECK_EQUAL(std::string(archiveStatusName(ArchiveStatus::IoError)), "IoError");
}

BOOST_AUTO_TEST_SUITE_END()
