/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE FilterTests
#include <boost/test/unit_test.hpp>

#include "archive/ArchiveBuilder.hpp"
#include "archive/ArchiveStore.hpp"
#include "archive/SpeciesFilter.hpp"
#include "core/Logger.hpp"
#include "mocks/SpeciesFixtures.hpp"
#include "mocks/TempCacheDirectory.hpp"
#include <algorithm>

using namespace DexVault;

namespace {

std::vector<int32_t> idsOf(const std::vector<SpeciesView>& views) {
    std::vector<int32_t> ids;
    ids.reserve(views.size());
    for (const auto& view : views) {
        ids.push_back(view.id());
    }
    return ids;
}

} // namespace

#define CHECK_IDS(views, ...)                                                         \
    do {                                                                              \
        std::vector<int32_t> actual_ = idsOf(views);                                  \
        std::vector<int32_t> expected_ = __VA_ARGS__;                                 \
        BOOST_CHECK_EQUAL_COLLECTIONS(actual_.begin(), actual_.end(), expected_.begin(), \
                                      expected_.end());                               \
    } while (0)

// Volcanion is stored first so stored order differs from id order
struct FilterFixture {
    TempCacheDirectory dir{"dexvault_filter"};
    ArchiveStore store;

    FilterFixture() {
        DEXVAULT_ENABLE_SILENT_MODE();
        auto records = Fixtures::expectedRecords(Fixtures::starterFixtures());
        std::rotate(records.begin(), records.end() - 1, records.end());

        auto path = dir / "species.dexv";
        BOOST_REQUIRE(ArchiveBuilder::writeArchive(records, path, 1000).status == BuildStatus::Ok);
        BOOST_REQUIRE(store.open(path) == ArchiveStatus::Ok);
    }
};

BOOST_FIXTURE_TEST_SUITE(ArchiveFilterTests, FilterFixture)

BOOST_AUTO_TEST_CASE(TestEmptyFilterReturnsEverythingInStoredOrder) {
    SpeciesFilter filter;
    BOOST_CHECK(filter.isEmpty());
    CHECK_IDS(store.filter(filter), {721, 1, 2, 4, 6, 7, 152, 158});
}

BOOST_AUTO_TEST_CASE(TestExclusiveTypesIntersect) {
    SpeciesFilter fireWater;
    fireWater.addType(TypeTag::Fire).addType(TypeTag::Water);
    CHECK_IDS(store.filter(fireWater), {721});

    SpeciesFilter grassPoison;
    grassPoison.addTypeName("grass").addTypeName("POISON");
    CHECK_IDS(store.filter(grassPoison), {1, 2});

    SpeciesFilter fireGrass;
    fireGrass.addType(TypeTag::Fire).addType(TypeTag::Grass);
    BOOST_CHECK(store.filter(fireGrass).empty());
}

BOOST_AUTO_TEST_CASE(TestInclusiveTypesUnion) {
    SpeciesFilter filter;
    filter.typeMode = TypeFilterMode::Inclusive;
    filter.addType(TypeTag::Fire).addType(TypeTag::Water);

    // Volcanion carries both but appears once
    CHECK_IDS(store.filter(filter), {721, 4, 6, 7, 158});
}

BOOST_AUTO_TEST_CASE(TestSingleTypeIsTheSameInBothModes) {
    SpeciesFilter exclusive;
    exclusive.addType(TypeTag::Water);
    SpeciesFilter inclusive = exclusive;
    inclusive.typeMode = TypeFilterMode::Inclusive;

    CHECK_IDS(store.filter(exclusive), {721, 7, 158});
    CHECK_IDS(store.filter(inclusive), {721, 7, 158});
}

BOOST_AUTO_TEST_CASE(TestGenerationsUnion) {
    SpeciesFilter filter;
    filter.addGeneration(Generation::I).addGeneration(Generation::II);
    CHECK_IDS(store.filter(filter), {1, 2, 4, 6, 7, 152, 158});

    SpeciesFilter byName;
    byName.addGenerationName("2").addGenerationName("generation-vi");
    CHECK_IDS(store.filter(byName), {721, 152, 158});
}

BOOST_AUTO_TEST_CASE(TestTypeAndGenerationIntersect) {
    SpeciesFilter filter;
    filter.addType(TypeTag::Water).addGeneration(Generation::II);
    CHECK_IDS(store.filter(filter), {158});
}

BOOST_AUTO_TEST_CASE(TestMinimumStatWithGeneration) {
    SpeciesFilter filter;
    filter.addGeneration(Generation::I).setMinStat(StatKind::Hp, 45);

    // Bound is inclusive: bulbasaur has exactly 45
    CHECK_IDS(store.filter(filter), {1, 2, 6});
}

BOOST_AUTO_TEST_CASE(TestSeveralMinimumStats) {
    SpeciesFilter filter;
    filter.setMinStat(StatKind::Attack, 60).setMinStat(StatKind::Speed, 60);
    BOOST_CHECK(filter.hasStatConstraint());
    CHECK_IDS(store.filter(filter), {721, 2, 6});
}

BOOST_AUTO_TEST_CASE(TestMinimumTotal) {
    SpeciesFilter filter;
    filter.minTotalStats = 534;
    CHECK_IDS(store.filter(filter), {721, 6});

    filter.minTotalStats = 601;
    BOOST_CHECK(store.filter(filter).empty());
}

BOOST_AUTO_TEST_CASE(TestNameQueryCombinesWithType) {
    SpeciesFilter filter;
    filter.addType(TypeTag::Fire);
    filter.nameQuery = "CHAR";
    CHECK_IDS(store.filter(filter), {4, 6});
}

BOOST_AUTO_TEST_CASE(TestUnknownTypeNameMatchesNothingWhenExclusive) {
    SpeciesFilter onlyUnknown;
    onlyUnknown.addTypeName("plasma");
    BOOST_CHECK(onlyUnknown.unresolvedType);
    BOOST_CHECK(onlyUnknown.types.empty());
    BOOST_CHECK(!onlyUnknown.isEmpty());
    BOOST_CHECK(store.filter(onlyUnknown).empty());

    SpeciesFilter mixed;
    mixed.addTypeName("fire").addTypeName("plasma");
    BOOST_CHECK(store.filter(mixed).empty());

    // The stored Unknown bucket is not addressable by name
    SpeciesFilter unknownBucket;
    unknownBucket.addTypeName("unknown");
    BOOST_CHECK(unknownBucket.unresolvedType);
    BOOST_CHECK(store.filter(unknownBucket).empty());
}

BOOST_AUTO_TEST_CASE(TestUnknownTypeNameContributesNothingWhenInclusive) {
    SpeciesFilter mixed;
    mixed.typeMode = TypeFilterMode::Inclusive;
    mixed.addTypeName("fire").addTypeName("plasma");
    CHECK_IDS(store.filter(mixed), {721, 4, 6});

    SpeciesFilter onlyUnknown;
    onlyUnknown.typeMode = TypeFilterMode::Inclusive;
    onlyUnknown.addTypeName("plasma");
    BOOST_CHECK(store.filter(onlyUnknown).empty());
}

BOOST_AUTO_TEST_CASE(TestUnresolvedGenerationMatchesNothing) {
    SpeciesFilter filter;
    filter.addGenerationName("generation-x");
    BOOST_CHECK(filter.unresolvedGeneration);
    BOOST_CHECK(store.filter(filter).empty());

    SpeciesFilter outOfRange;
    outOfRange.addGenerationName("10");
    BOOST_CHECK(store.filter(outOfRange).empty());
}

BOOST_AUTO_TEST_CASE(TestFilterOnClosedStoreIsEmpty) {
    store.close();
    SpeciesFilter filter;
    filter.addType(TypeTag::Fire);
    BOOST_CHECK(store.filter(filter).empty());
    BOOST_CHECK(store.filter(SpeciesFilter{}).empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SpeciesFilterTests)

BOOST_AUTO_TEST_CASE(TestParseTypeFilterMode) {
    BOOST_CHECK(parseTypeFilterMode("exclusive") == TypeFilterMode::Exclusive);
    BOOST_CHECK(parseTypeFilterMode("Inclusive") == TypeFilterMode::Inclusive);
    BOOST_CHECK(parseTypeFilterMode("EXCLUSIVE") == TypeFilterMode::Exclusive);
    BOOST_CHECK(!parseTypeFilterMode("both").has_value());
    BOOST_CHECK(!parseTypeFilterMode("").has_value());

    BOOST_CHECK_EQUAL(std::string(typeFilterModeName(TypeFilterMode::Inclusive)), "inclusive");
    BOOST_CHECK_EQUAL(std::string(typeFilterModeName(TypeFilterMode::Exclusive)), "exclusive");
}

BOOST_AUTO_TEST_CASE(TestAddMethodsDeduplicate) {
    SpeciesFilter filter;
    filter.addType(TypeTag::Fire).addTypeName("FIRE").addType(TypeTag::Fire);
    BOOST_CHECK_EQUAL(filter.types.size(), 1u);
    BOOST_CHECK(!filter.unresolvedType);

    filter.addGeneration(Generation::III).addGenerationName("iii").addGenerationName("generation-iii");
    BOOST_CHECK_EQUAL(filter.generations.size(), 1u);
    BOOST_CHECK(!filter.unresolvedGeneration);
}

BOOST_AUTO_TEST_CASE(TestIsEmpty) {
    BOOST_CHECK(SpeciesFilter{}.isEmpty());

    SpeciesFilter withStat;
    withStat.setMinStat(StatKind::Defense, 1);
    BOOST_CHECK(!withStat.isEmpty());

    SpeciesFilter withName;
    withName.nameQuery = "mew";
    BOOST_CHECK(!withName.isEmpty());

    SpeciesFilter withGeneration;
    withGeneration.addGenerationName("nonsense");
    BOOST_CHECK(withGeneration.hasGenerationConstraint());
    BOOST_CHECK(!withGeneration.isEmpty());
}

BOOST_AUTO_TEST_SUITE_END()
