/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "core/Logger.hpp"
#include "managers/CacheLifecycleManager.hpp"
#include "managers/RemoteFetcher.hpp"
#include "managers/SettingsManager.hpp"
#include <filesystem>
#include <fstream>
#include <thread>

using namespace DexVault;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile = "tests/test_data/test_settings.json";

    SettingsTestFixture() {
        DEXVAULT_ENABLE_SILENT_MODE();
        std::filesystem::create_directories("tests/test_data");
        SettingsManager::Instance().clearAll();
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
        file.close();
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetTypedValues) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set(SettingsKeys::DISPLAY, SettingsKeys::RECORDS_PER_PAGE, 50));
    BOOST_CHECK_EQUAL(settings.get<int>(SettingsKeys::DISPLAY, SettingsKeys::RECORDS_PER_PAGE, 0), 50);

    BOOST_CHECK(settings.set(SettingsKeys::CACHE, SettingsKeys::DOWNLOAD_SPRITES, false));
    BOOST_CHECK_EQUAL(settings.get<bool>(SettingsKeys::CACHE, SettingsKeys::DOWNLOAD_SPRITES, true), false);

    BOOST_CHECK(settings.set(SettingsKeys::NETWORK, SettingsKeys::BASE_URL, std::string("http://localhost:8080")));
    BOOST_CHECK_EQUAL(settings.get<std::string>(SettingsKeys::NETWORK, SettingsKeys::BASE_URL, ""),
                      "http://localhost:8080");

    // Missing key returns the supplied default
    BOOST_CHECK_EQUAL(settings.get<int>("display", "nonexistent", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestApplyDefaultsKeepsExistingValues) {
    auto& settings = SettingsManager::Instance();

    settings.set(SettingsKeys::NETWORK, SettingsKeys::WORKER_COUNT, 3);
    settings.applyDefaults();

    BOOST_CHECK_EQUAL(settings.get<int>(SettingsKeys::NETWORK, SettingsKeys::WORKER_COUNT, 0), 3);
    BOOST_CHECK_EQUAL(settings.get<int>(SettingsKeys::NETWORK, SettingsKeys::MAX_ATTEMPTS, 0), 3);
    BOOST_CHECK_EQUAL(settings.get<int>(SettingsKeys::DISPLAY, SettingsKeys::RECORDS_PER_PAGE, 0), 30);
    BOOST_CHECK_EQUAL(settings.get<std::string>(SettingsKeys::DISPLAY, SettingsKeys::TYPE_FILTER_MODE, ""),
                      "exclusive");
    BOOST_CHECK_EQUAL(settings.get<bool>(SettingsKeys::CACHE, SettingsKeys::DOWNLOAD_SPRITES, false), true);
}

BOOST_AUTO_TEST_CASE(TestRecordsPerPage) {
    auto& settings = SettingsManager::Instance();

    // Unset and defaulted agree
    BOOST_CHECK_EQUAL(settings.getRecordsPerPage(), 30);
    settings.applyDefaults();
    BOOST_CHECK_EQUAL(settings.getRecordsPerPage(), 30);
    BOOST_CHECK_EQUAL(settings.get<int>(SettingsKeys::DISPLAY, SettingsKeys::RECORDS_PER_PAGE, 0),
                      SettingsDefaults::RECORDS_PER_PAGE);

    settings.set(SettingsKeys::DISPLAY, SettingsKeys::RECORDS_PER_PAGE, 12);
    BOOST_CHECK_EQUAL(settings.getRecordsPerPage(), 12);
    settings.set(SettingsKeys::DISPLAY, SettingsKeys::RECORDS_PER_PAGE, 0);
    BOOST_CHECK_EQUAL(settings.getRecordsPerPage(), 1);
}

BOOST_AUTO_TEST_CASE(TestHasRemoveAndClear) {
    auto& settings = SettingsManager::Instance();

    settings.set("test", "key1", 1);
    settings.set("test", "key2", 2);
    settings.set("other", "key1", 3);

    BOOST_CHECK(settings.has("test", "key1"));
    BOOST_CHECK(settings.remove("test", "key1"));
    BOOST_CHECK(!settings.has("test", "key1"));
    BOOST_CHECK(settings.has("test", "key2"));
    BOOST_CHECK(!settings.remove("test", "nonexistent"));

    BOOST_CHECK(settings.clearCategory("test"));
    BOOST_CHECK(!settings.has("test", "key2"));
    BOOST_CHECK(settings.has("other", "key1"));
    BOOST_CHECK(!settings.clearCategory("nonexistent"));

    settings.clearAll();
    BOOST_CHECK(!settings.has("other", "key1"));
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    auto& settings = SettingsManager::Instance();

    createTestFile(R"({
  "display": { "type_filter_mode": "inclusive", "records_per_page": 12 },
  "network": { "base_url": "http://mirror.local/api/v2/", "retry_backoff_ms": 5 },
  "cache": { "max_age_days": 14, "download_sprites": false }
})");

    BOOST_CHECK(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<std::string>("display", "type_filter_mode", ""), "inclusive");
    BOOST_CHECK_EQUAL(settings.get<int>("display", "records_per_page", 0), 12);
    BOOST_CHECK_EQUAL(settings.get<int>("cache", "max_age_days", 0), 14);
    BOOST_CHECK_EQUAL(settings.get<bool>("cache", "download_sprites", true), false);
}

BOOST_AUTO_TEST_CASE(TestSaveToFile) {
    auto& settings = SettingsManager::Instance();

    settings.set("display", "records_per_page", 24);
    settings.set("cache", "download_sprites", true);
    settings.set("network", "base_url", std::string("https://pokeapi.co/api/v2"));

    BOOST_CHECK(settings.saveToFile(testFile));
    BOOST_CHECK(std::filesystem::exists(testFile));

    settings.clearAll();
    BOOST_CHECK(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("display", "records_per_page", 0), 24);
    BOOST_CHECK_EQUAL(settings.get<bool>("cache", "download_sprites", false), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("network", "base_url", ""), "https://pokeapi.co/api/v2");
}

BOOST_AUTO_TEST_CASE(TestFetcherConfigFromSettings) {
    auto& settings = SettingsManager::Instance();

    settings.set(SettingsKeys::NETWORK, SettingsKeys::BASE_URL, std::string("http://mirror.local/api"));
    settings.set(SettingsKeys::NETWORK, SettingsKeys::WORKER_COUNT, 0);
    settings.set(SettingsKeys::NETWORK, SettingsKeys::MAX_ATTEMPTS, 5);
    settings.set(SettingsKeys::NETWORK, SettingsKeys::RETRY_BACKOFF_MS, 40);
    settings.set(SettingsKeys::CACHE, SettingsKeys::DOWNLOAD_SPRITES, false);

    FetcherConfig config = FetcherConfig::fromSettings();
    BOOST_CHECK_EQUAL(config.baseUrl, "http://mirror.local/api");
    // Zero workers is clamped to one
    BOOST_CHECK_EQUAL(config.workerCount, 1u);
    BOOST_CHECK_EQUAL(config.maxAttempts, 5u);
    BOOST_CHECK_EQUAL(config.retryBackoff.count(), 40);
    BOOST_CHECK(!config.downloadSprites);

    settings.set(SettingsKeys::NETWORK, SettingsKeys::MAX_ATTEMPTS, 100);
    BOOST_CHECK_EQUAL(FetcherConfig::fromSettings().maxAttempts, FetcherConfig::MAX_ATTEMPTS_LIMIT);
    settings.set(SettingsKeys::NETWORK, SettingsKeys::MAX_ATTEMPTS, -2);
    BOOST_CHECK_EQUAL(FetcherConfig::fromSettings().maxAttempts, 1u);
}

BOOST_AUTO_TEST_CASE(TestLifecycleConfigFromSettings) {
    auto& settings = SettingsManager::Instance();

    settings.set(SettingsKeys::CACHE, SettingsKeys::DIRECTORY, std::string("tests/test_data/cache"));
    settings.set(SettingsKeys::CACHE, SettingsKeys::MAX_AGE_DAYS, -3);
    settings.set(SettingsKeys::CACHE, SettingsKeys::MAX_FAILED_PERCENT, 250);

    auto config = LifecycleConfig::fromSettings();
    BOOST_REQUIRE(config.has_value());
    BOOST_CHECK_EQUAL(config->paths.root(), std::filesystem::path("tests/test_data/cache"));
    BOOST_CHECK_EQUAL(config->maxAgeDays, 0);
    BOOST_CHECK_EQUAL(config->maxFailedPercent, 100);
}

BOOST_AUTO_TEST_CASE(TestChangeListener) {
    auto& settings = SettingsManager::Instance();

    int callbackCount = 0;
    std::string lastKey;

    auto callbackId = settings.registerChangeListener(SettingsKeys::DISPLAY,
        [&](const std::string& category, const std::string& key, const SettingsManager::SettingValue& value) {
            (void)category;
            (void)value;
            callbackCount++;
            lastKey = key;
        });

    settings.set(SettingsKeys::DISPLAY, SettingsKeys::RECORDS_PER_PAGE, 10);
    settings.set(SettingsKeys::DISPLAY, SettingsKeys::RECORDS_PER_ROW, 4);
    settings.set(SettingsKeys::NETWORK, SettingsKeys::WORKER_COUNT, 2);  // other category

    BOOST_CHECK_EQUAL(callbackCount, 2);
    BOOST_CHECK_EQUAL(lastKey, SettingsKeys::RECORDS_PER_ROW);

    settings.unregisterChangeListener(callbackId);
    settings.set(SettingsKeys::DISPLAY, SettingsKeys::RECORDS_PER_PAGE, 11);
    BOOST_CHECK_EQUAL(callbackCount, 2);
}

BOOST_AUTO_TEST_CASE(TestThreadSafety) {
    auto& settings = SettingsManager::Instance();

    const int numThreads = 8;
    const int operationsPerThread = 100;
    std::vector<std::thread> threads;

    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&settings, t, count=operationsPerThread]() {
            for (int i = 0; i < count; ++i) {
                std::string category = "category" + std::to_string(t);
                std::string key = "key" + std::to_string(i);
                settings.set(category, key, i * t);
                BOOST_CHECK(settings.get<int>(category, key, -1) != -1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 0; t < numThreads; ++t) {
        BOOST_CHECK_EQUAL(settings.getKeys("category" + std::to_string(t)).size(),
                          static_cast<size_t>(operationsPerThread));
    }
}

BOOST_AUTO_TEST_CASE(TestInvalidFile) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(!settings.loadFromFile("nonexistent_file.json"));

    createTestFile("{ invalid json }");
    BOOST_CHECK(!settings.loadFromFile(testFile));

    createTestFile("[1, 2, 3]");
    BOOST_CHECK(!settings.loadFromFile(testFile));
}

BOOST_AUTO_TEST_CASE(TestTypeMismatch) {
    auto& settings = SettingsManager::Instance();

    settings.set("test", "value", std::string("text"));

    BOOST_CHECK_EQUAL(settings.get<int>("test", "value", 7), 7);
    BOOST_CHECK_EQUAL(settings.get<bool>("test", "value", true), true);
}

BOOST_AUTO_TEST_SUITE_END()
