/**
 * @file test_corruption_detector.cpp
 * @brief Unit tests for CCorruptionDetector
 * @date 2025-12-01
 */

#include <gtest/gtest.h>
#include <chrono>
#include <fstream>
#include <thread>
#include <lap/core/CPath.hpp>
#include <lap/core/CMemory.hpp>
#include "CCorruptionDetector.hpp"
#include "CFileCache.hpp"

using namespace lap::rds;
using namespace lap::core;

class CorruptionDetectorTest : public ::testing::Test {
protected:
    const String testDir = "/tmp/rds_corruption_test";
    UniqueHandle<CCorruptionDetector> detector;

    void SetUp() override {
        if (Path::isDirectory(testDir)) {
            Path::removeDirectory(testDir, true);
        }
        Path::createDirectory(testDir);
        detector = MakeUnique<CCorruptionDetector>(60, 100);
    }

    void TearDown() override {
        detector.reset();
        if (Path::isDirectory(testDir)) {
            Path::removeDirectory(testDir, true);
        }
    }

    String writeFile(const String& name, const String& content,
                     std::ios::openmode mode = std::ios::binary | std::ios::trunc) {
        String path = testDir + "/" + name;
        std::ofstream out(path, mode);
        out << content;
        return path;
    }
};

TEST_F(CorruptionDetectorTest, JSON_ValidAndInvalid) {
    String good = writeFile("good.json", "{\"a\": [1, 2, 3]}");
    String bad = writeFile("bad.json", "{\"a\": [1, 2,");
    String empty = writeFile("empty.json", "");

    EXPECT_TRUE(detector->isValidJSON(good));
    EXPECT_FALSE(detector->isValidJSON(bad));
    EXPECT_FALSE(detector->isValidJSON(empty));

    EXPECT_FALSE(detector->detectCorruption(good, FormatKind::kJson));
    EXPECT_TRUE(detector->detectCorruption(bad, FormatKind::kJson));
    EXPECT_TRUE(detector->detectCorruption(bad, "json_array"));
}

TEST_F(CorruptionDetectorTest, JSONLines_BlankLinesIgnored) {
    String path = writeFile("records.jsonl", "{\"a\":1}\n\n{\"b\":2}\n   \n");
    EXPECT_TRUE(detector->isValidJSONLines(path));

    String empty = writeFile("empty.jsonl", "");
    EXPECT_TRUE(detector->isValidJSONLines(empty));
}

TEST_F(CorruptionDetectorTest, JSONLines_AppendedGarbageIsCorruption) {
    String path = writeFile("records.jsonl", "{\"a\":1}\n{\"b\":2}\n");
    ASSERT_FALSE(detector->detectCorruption(path, FormatKind::kJsonLines));

    writeFile("records.jsonl", "{not json\n", std::ios::binary | std::ios::app);
    EXPECT_TRUE(detector->detectCorruption(path, FormatKind::kJsonLines));
}

TEST_F(CorruptionDetectorTest, CSV_Rules) {
    String good = writeFile("good.csv", "id,name\n1,x\n");
    String empty = writeFile("empty.csv", "");
    String open = writeFile("open.csv", "id,name\n1,\"x\n");
    String nul = writeFile("nul.csv", String("id,name\n1,x\0y\n", 14));

    EXPECT_TRUE(detector->isValidCSV(good));
    EXPECT_FALSE(detector->isValidCSV(empty));
    EXPECT_FALSE(detector->isValidCSV(open));
    EXPECT_FALSE(detector->isValidCSV(nul));

    EXPECT_TRUE(detector->detectCorruption(empty, "csv"));
}

TEST_F(CorruptionDetectorTest, Missing_IsCorruptedAndNotCached) {
    String path = testDir + "/absent.json";

    EXPECT_TRUE(detector->detectCorruption(path, FormatKind::kJson));
    EXPECT_TRUE(detector->detectCorruption(path, FormatKind::kUnknown));
    EXPECT_EQ(detector->cacheSize(), 0u);
    EXPECT_FALSE(File::Util::exists(path));
}

TEST_F(CorruptionDetectorTest, UnknownFormat_ChecksReadability) {
    String path = writeFile("blob.bin", "not in any format {");
    EXPECT_FALSE(detector->detectCorruption(path, "parquet"));
    EXPECT_TRUE(detector->isReadable(path));
}

TEST_F(CorruptionDetectorTest, Cache_FollowsFileChanges) {
    String path = writeFile("data.json", "{\"v\":1}");
    ASSERT_TRUE(detector->isValidJSON(path));
    EXPECT_EQ(detector->cacheSize(), 1u);

    // different size, the cached verdict must not be used
    writeFile("data.json", "{\"v\":1, broken");
    EXPECT_FALSE(detector->isValidJSON(path));
    EXPECT_EQ(detector->cacheSize(), 1u);
}

TEST_F(CorruptionDetectorTest, Cache_PerFormat) {
    String path = writeFile("data.txt", "{\"v\":1}\n");
    EXPECT_TRUE(detector->isValidJSON(path));
    EXPECT_TRUE(detector->isValidJSONLines(path));
    EXPECT_TRUE(detector->isValidCSV(path));
    EXPECT_EQ(detector->cacheSize(), 3u);

    detector->invalidate(path);
    EXPECT_EQ(detector->cacheSize(), 0u);
}

TEST_F(CorruptionDetectorTest, Invalidate_OnlyTouchesGivenPath) {
    String first = writeFile("a.json", "{}");
    String second = writeFile("a.json.old", "{}");
    detector->isValidJSON(first);
    detector->isValidJSON(second);
    ASSERT_EQ(detector->cacheSize(), 2u);

    detector->invalidate(first);
    EXPECT_EQ(detector->cacheSize(), 1u);

    detector->clearCache();
    EXPECT_EQ(detector->cacheSize(), 0u);
}

TEST_F(CorruptionDetectorTest, FileCache_VerdictExpiresAfterTtl) {
    String path = writeFile("ttl.json", "{}");
    FileFingerprint fingerprint = fingerprintOf(path);
    CFileCache<Bool> cache(std::chrono::seconds(1), 10);

    cache.put(path, fingerprint, true);
    auto fresh = cache.get(path, fingerprint);
    ASSERT_TRUE(fresh.has_value());
    EXPECT_TRUE(*fresh);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    // file untouched, only the age rules the entry out
    EXPECT_EQ(fingerprintOf(path), fingerprint);
    EXPECT_FALSE(cache.get(path, fingerprint).has_value());
    EXPECT_EQ(cache.size(), 1u);
}
