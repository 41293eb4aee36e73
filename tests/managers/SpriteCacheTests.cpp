/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE SpriteCacheTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/RemoteFetcher.hpp"
#include "managers/SpriteCacheManager.hpp"
#include "mocks/MockHttpTransport.hpp"
#include "mocks/SpeciesFixtures.hpp"
#include "mocks/TempCacheDirectory.hpp"
#include "utils/CachePaths.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace DexVault;

struct ThreadPoolFixture {
    ThreadPoolFixture() {
        DEXVAULT_ENABLE_SILENT_MODE();
        ThreadSystem::Instance().init(4);
    }
    ~ThreadPoolFixture() { ThreadSystem::Instance().clean(); }
};

BOOST_GLOBAL_FIXTURE(ThreadPoolFixture);

struct SpriteCacheFixture {
    TempCacheDirectory dir{"dexvault_sprites"};
    CachePaths paths{dir.path()};
    std::shared_ptr<MockHttpTransport> transport = std::make_shared<MockHttpTransport>();
    std::shared_ptr<RemoteFetcher> fetcher;
    std::unique_ptr<SpriteCacheManager> sprites;

    SpriteCacheFixture() {
        Fixtures::registerFixtures(*transport, Fixtures::starterFixtures());
        FetcherConfig config;
        config.baseUrl = Fixtures::BASE_URL;
        config.retryBackoff = std::chrono::milliseconds(1);
        fetcher = std::make_shared<RemoteFetcher>(transport, config);
        BOOST_REQUIRE(paths.ensureDirectories());
        sprites = std::make_unique<SpriteCacheManager>(paths, fetcher, 4);
    }

    static bool resolved(const std::shared_future<bool>& future) {
        return future.wait_for(std::chrono::seconds(10)) == std::future_status::ready;
    }
};

BOOST_FIXTURE_TEST_SUITE(SpriteCacheTestSuite, SpriteCacheFixture)

BOOST_AUTO_TEST_CASE(TestSpritePathLayout) {
    BOOST_CHECK_EQUAL(sprites->spritePath(25), dir.path() / "sprites" / "25.png");
    BOOST_CHECK(!sprites->hasSprite(25));
}

BOOST_AUTO_TEST_CASE(TestStoreWritesFile) {
    BOOST_CHECK(sprites->store(25, Fixtures::spriteBytes(25)));
    BOOST_CHECK(sprites->hasSprite(25));
    BOOST_CHECK(TempCacheDirectory::readFile(sprites->spritePath(25)) == Fixtures::spriteBytes(25));

    // Overwrite replaces the whole file
    BOOST_CHECK(sprites->store(25, {1, 2}));
    BOOST_CHECK((TempCacheDirectory::readFile(sprites->spritePath(25)) == std::vector<uint8_t>{1, 2}));
}

BOOST_AUTO_TEST_CASE(TestConcurrentStoresOfOneSpriteAllSucceed) {
    constexpr int WRITERS = 8;
    std::vector<std::vector<uint8_t>> payloads;
    for (int i = 0; i < WRITERS; ++i) {
        payloads.push_back(std::vector<uint8_t>(4096, static_cast<uint8_t>(i + 1)));
    }

    std::atomic<int> stored{0};
    std::vector<std::thread> writers;
    for (int i = 0; i < WRITERS; ++i) {
        writers.emplace_back([&, i]() {
            for (int round = 0; round < 10; ++round) {
                if (sprites->store(25, payloads[i])) {
                    stored.fetch_add(1);
                }
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    BOOST_CHECK_EQUAL(stored.load(), WRITERS * 10);

    // The survivor is one writer's complete payload
    auto bytes = TempCacheDirectory::readFile(sprites->spritePath(25));
    BOOST_REQUIRE_EQUAL(bytes.size(), 4096u);
    BOOST_CHECK(std::all_of(bytes.begin(), bytes.end(), [&bytes](uint8_t b) { return b == bytes.front(); }));

    size_t leftovers = 0;
    for (const auto& entry : std::filesystem::directory_iterator(paths.spriteDirectory())) {
        if (entry.path().extension() == ".tmp") {
            ++leftovers;
        }
    }
    BOOST_CHECK_EQUAL(leftovers, 0u);
}

BOOST_AUTO_TEST_CASE(TestStoreRejectsEmptyBytes) {
    BOOST_CHECK(!sprites->store(25, {}));
    BOOST_CHECK(!sprites->hasSprite(25));
}

BOOST_AUTO_TEST_CASE(TestStoreAllCountsFailures) {
    std::unordered_map<int32_t, std::vector<uint8_t>> batch = {
        {1, Fixtures::spriteBytes(1)},
        {4, Fixtures::spriteBytes(4)},
        {7, {}},
    };
    BOOST_CHECK_EQUAL(sprites->storeAll(batch), 1u);
    BOOST_CHECK(sprites->hasSprite(1));
    BOOST_CHECK(sprites->hasSprite(4));
    BOOST_CHECK(!sprites->hasSprite(7));
}

BOOST_AUTO_TEST_CASE(TestEnsureReadyWhenCached) {
    BOOST_REQUIRE(sprites->store(6, Fixtures::spriteBytes(6)));

    SpriteLookup lookup = sprites->ensure(6, Fixtures::spriteUrl(6));
    BOOST_CHECK(lookup.status == SpriteStatus::Ready);
    BOOST_CHECK_EQUAL(lookup.path, sprites->spritePath(6));
    BOOST_CHECK(!lookup.download.valid());
    BOOST_CHECK_EQUAL(transport->totalRequests(), 0u);
}

BOOST_AUTO_TEST_CASE(TestEnsureDownloadsMissingSprite) {
    SpriteLookup lookup = sprites->ensure(6, Fixtures::spriteUrl(6));
    BOOST_REQUIRE(lookup.status == SpriteStatus::Pending);
    BOOST_REQUIRE(lookup.download.valid());
    BOOST_REQUIRE(resolved(lookup.download));
    BOOST_CHECK(lookup.download.get());

    BOOST_CHECK(sprites->hasSprite(6));
    BOOST_CHECK(TempCacheDirectory::readFile(lookup.path) == Fixtures::spriteBytes(6));
    BOOST_CHECK(sprites->ensure(6, Fixtures::spriteUrl(6)).status == SpriteStatus::Ready);
}

BOOST_AUTO_TEST_CASE(TestEnsureUnavailableWithoutSource) {
    BOOST_CHECK(sprites->ensure(158, "").status == SpriteStatus::Unavailable);

    SpriteCacheManager offline(paths, nullptr);
    SpriteLookup lookup = offline.ensure(6, Fixtures::spriteUrl(6));
    BOOST_CHECK(lookup.status == SpriteStatus::Unavailable);
    BOOST_CHECK_EQUAL(lookup.path, paths.spritePath(6));
    BOOST_CHECK_EQUAL(transport->totalRequests(), 0u);
}

BOOST_AUTO_TEST_CASE(TestFailedDownloadResolvesFalse) {
    const std::string url = Fixtures::spriteUrl(999);

    SpriteLookup lookup = sprites->ensure(999, url);
    BOOST_REQUIRE(lookup.status == SpriteStatus::Pending);
    BOOST_REQUIRE(resolved(lookup.download));
    BOOST_CHECK(!lookup.download.get());
    BOOST_CHECK(!sprites->hasSprite(999));
    BOOST_CHECK_EQUAL(sprites->pendingDownloads(), 0u);

    // A later request tries again
    transport->setBytes(url, Fixtures::spriteBytes(999));
    SpriteLookup retry = sprites->ensure(999, url);
    BOOST_REQUIRE(retry.status == SpriteStatus::Pending);
    BOOST_REQUIRE(resolved(retry.download));
    BOOST_CHECK(retry.download.get());
    BOOST_CHECK(sprites->hasSprite(999));
}

BOOST_AUTO_TEST_CASE(TestConcurrentEnsureSharesDownload) {
    transport->setDelay(std::chrono::milliseconds(150));

    SpriteLookup first = sprites->ensure(4, Fixtures::spriteUrl(4));
    SpriteLookup second = sprites->ensure(4, Fixtures::spriteUrl(4));
    BOOST_REQUIRE(first.status == SpriteStatus::Pending);
    BOOST_REQUIRE(second.status == SpriteStatus::Pending);
    BOOST_CHECK_EQUAL(sprites->pendingDownloads(), 1u);

    BOOST_REQUIRE(resolved(first.download));
    BOOST_REQUIRE(resolved(second.download));
    BOOST_CHECK(first.download.get());
    BOOST_CHECK(second.download.get());
    BOOST_CHECK_EQUAL(transport->requestCount(Fixtures::spriteUrl(4)), 1);
}

BOOST_AUTO_TEST_CASE(TestClearRemovesSprites) {
    BOOST_REQUIRE(sprites->store(1, Fixtures::spriteBytes(1)));
    BOOST_REQUIRE(sprites->store(2, Fixtures::spriteBytes(2)));

    BOOST_CHECK(sprites->clear());
    BOOST_CHECK(!sprites->hasSprite(1));
    BOOST_CHECK(!sprites->hasSprite(2));
    BOOST_CHECK(std::filesystem::is_directory(paths.spriteDirectory()));

    // Still usable afterwards
    BOOST_CHECK(sprites->store(1, Fixtures::spriteBytes(1)));
}

BOOST_AUTO_TEST_CASE(TestRenewAllReplacesEverything) {
    BOOST_REQUIRE(sprites->store(1, {0xDE, 0xAD}));
    BOOST_REQUIRE(sprites->store(2, Fixtures::spriteBytes(2)));

    std::vector<std::pair<int32_t, std::string>> entries = {
        {1, Fixtures::spriteUrl(1)},
        {4, Fixtures::spriteUrl(4)},
        {158, ""},
        {999, Fixtures::spriteUrl(999)},
    };
    BOOST_CHECK_EQUAL(sprites->renewAll(entries), 2u);

    BOOST_CHECK(TempCacheDirectory::readFile(sprites->spritePath(1)) == Fixtures::spriteBytes(1));
    BOOST_CHECK(sprites->hasSprite(4));
    BOOST_CHECK(!sprites->hasSprite(158));
    BOOST_CHECK(!sprites->hasSprite(999));

    // Sprites not listed are gone after a renew
    BOOST_CHECK(!sprites->hasSprite(2));
}

BOOST_AUTO_TEST_CASE(TestRenewAllWithoutFetcherFailsEverything) {
    SpriteCacheManager offline(paths, nullptr);
    BOOST_REQUIRE(offline.store(1, Fixtures::spriteBytes(1)));

    BOOST_CHECK_EQUAL(offline.renewAll({{1, Fixtures::spriteUrl(1)}}), 1u);
    BOOST_CHECK(offline.hasSprite(1));
}

BOOST_AUTO_TEST_CASE(TestStatusNames) {
    BOOST_CHECK_EQUAL(std::string(spriteStatusName(SpriteStatus::Ready)), "Ready");
    BOOST_CHECK_EQUAL(std::string(spriteStatusName(SpriteStatus::Pending)), "Pending");
    BOOST_CHECK_EQUAL(std::string(spriteStatusName(SpriteStatus::Unavailable)), "Unavailable");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CachePathsTestSuite)

BOOST_AUTO_TEST_CASE(TestLayoutUnderRoot) {
    CachePaths paths("/var/cache/dexvault");
    BOOST_CHECK_EQUAL(paths.root(), std::filesystem::path("/var/cache/dexvault"));
    BOOST_CHECK_EQUAL(paths.archivePath(), std::filesystem::path("/var/cache/dexvault/species.dexv"));
    BOOST_CHECK_EQUAL(paths.spriteDirectory(), std::filesystem::path("/var/cache/dexvault/sprites"));
    BOOST_CHECK_EQUAL(paths.spritePath(721), std::filesystem::path("/var/cache/dexvault/sprites/721.png"));
}

BOOST_AUTO_TEST_CASE(TestResolveConfiguredDirectory) {
    TempCacheDirectory dir{"dexvault_paths"};
    auto resolvedPaths = CachePaths::resolve((dir / "nested").string());
    BOOST_REQUIRE(resolvedPaths.has_value());
    BOOST_CHECK_EQUAL(resolvedPaths->root(), dir / "nested");

    BOOST_CHECK(resolvedPaths->ensureDirectories());
    BOOST_CHECK(std::filesystem::is_directory(resolvedPaths->spriteDirectory()));
}

BOOST_AUTO_TEST_CASE(TestEnsureDirectoriesFailsOverFile) {
    TempCacheDirectory dir{"dexvault_paths"};
    TempCacheDirectory::writeFile(dir / "blocker", {1});

    CachePaths paths(dir / "blocker");
    BOOST_CHECK(!paths.ensureDirectories());
}

BOOST_AUTO_TEST_SUITE_END()
