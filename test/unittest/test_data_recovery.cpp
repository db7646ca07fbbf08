/**
 * @file test_data_recovery.cpp
 * @brief Unit tests for CDataRecovery
 * @date 2025-12-01
 */

#include <gtest/gtest.h>
#include <fstream>
#include <lap/core/CPath.hpp>
#include <lap/core/CMemory.hpp>
#include "CDataRecovery.hpp"

using namespace lap::rds;
using namespace lap::core;

class DataRecoveryTest : public ::testing::Test {
protected:
    const String testDir = "/tmp/rds_data_recovery_test";
    UniqueHandle<CDataRecovery> recovery;

    void SetUp() override {
        if (Path::isDirectory(testDir)) {
            Path::removeDirectory(testDir, true);
        }
        Path::createDirectory(testDir);
        recovery = MakeUnique<CDataRecovery>();
    }

    void TearDown() override {
        recovery.reset();
        if (Path::isDirectory(testDir)) {
            Path::removeDirectory(testDir, true);
        }
    }

    String writeFile(const String& name, const String& content) {
        String path = testDir + "/" + name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
        return path;
    }
};

TEST_F(DataRecoveryTest, RecoverLines_SkipsBrokenLines) {
    Json records = CDataRecovery::recoverLines("{\"a\":1}\n{not json}\n{\"b\":2}\n");
    EXPECT_EQ(records, Json::parse("[{\"a\":1},{\"b\":2}]"));
}

TEST_F(DataRecoveryTest, RecoverLines_AnyJsonValue) {
    Json records = CDataRecovery::recoverLines("1\n\"text\"\n\n[true]\r\nnope\n");
    EXPECT_EQ(records, Json::parse("[1,\"text\",[true]]"));
}

TEST_F(DataRecoveryTest, RecoverObjects_BalancedSpans) {
    Json records = CDataRecovery::recoverObjects("junk {\"a\":1} more {\"b\":{\"c\":2}} tail {\"open\":");
    EXPECT_EQ(records, Json::parse("[{\"a\":1},{\"b\":{\"c\":2}}]"));
}

TEST_F(DataRecoveryTest, RecoverObjects_BracesInsideStrings) {
    String text = "xx{\"s\":\"}{\",\"t\":\"\\\"}\"} yy {\"n\":1}";
    Json records = CDataRecovery::recoverObjects(text);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["s"], "}{");
    EXPECT_EQ(records[0]["t"], "\"}");
    EXPECT_EQ(records[1]["n"], 1);
}

TEST_F(DataRecoveryTest, RecoverJSONFile_LinePass) {
    String path = writeFile("events.json", "{\"a\":1}\n{not json}\n{\"b\":2}\n");

    auto recovered = recovery->recoverJSONFile(path);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, Json::parse("[{\"a\":1},{\"b\":2}]"));
}

TEST_F(DataRecoveryTest, RecoverJSONFile_IntactDocumentAsIs) {
    String array = writeFile("array.json", "[{\"a\":1}]");
    auto recovered = recovery->recoverJSONFile(array);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, Json::parse("[{\"a\":1}]"));

    String object = writeFile("object.json", "{\n  \"a\": 1,\n  \"b\": [2, 3]\n}\n");
    recovered = recovery->recoverJSONFile(object);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, Json::parse("[{\"a\":1,\"b\":[2,3]}]"));

    String empty = writeFile("empty_array.json", "[]");
    EXPECT_FALSE(recovery->recoverJSONFile(empty).has_value());
}

TEST_F(DataRecoveryTest, RecoverJSONFile_FallsBackToBraceScan) {
    String path = writeFile("single.json", "[{\"id\": 1, \"v\": \"x\"}, {\"id\": 2, \"v\": \"y\"}, {\"id\": 3");

    auto recovered = recovery->recoverJSONFile(path);
    ASSERT_TRUE(recovered.has_value());
    ASSERT_EQ(recovered->size(), 2u);
    EXPECT_EQ((*recovered)[1]["v"], "y");
}

TEST_F(DataRecoveryTest, RecoverJSONFile_NothingRecoverable) {
    String path = writeFile("noise.json", "corrupted!!! not json");
    EXPECT_FALSE(recovery->recoverJSONFile(path).has_value());
    EXPECT_FALSE(recovery->recoverJSONFile(testDir + "/absent.json").has_value());
    EXPECT_EQ(recovery->cacheSize(), 0u);
}

TEST_F(DataRecoveryTest, RecoverJSONFile_CachedUntilFileChanges) {
    String path = writeFile("events.json", "{\"a\":1}\nbad\n");
    ASSERT_TRUE(recovery->recoverJSONFile(path).has_value());
    EXPECT_EQ(recovery->cacheSize(), 1u);

    writeFile("events.json", "{\"a\":1}\n{\"a\":2}\nbad line\n");
    auto recovered = recovery->recoverJSONFile(path);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(recovered->size(), 2u);

    recovery->invalidate(path);
    EXPECT_EQ(recovery->cacheSize(), 0u);
}

TEST_F(DataRecoveryTest, RecoverCSVFile_DropsMismatchedRows) {
    String path = writeFile("table.csv", "id,name\n1,alpha\n2\n3,gamma,extra\n4,delta\n");

    auto rows = recovery->recoverCSVFile(path);
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows->size(), 2u);
    EXPECT_EQ((*rows)[0].at("name"), "alpha");
    EXPECT_EQ((*rows)[1].at("id"), "4");
}

TEST_F(DataRecoveryTest, RecoverCSVFile_TruncatedQuote) {
    String path = writeFile("table.csv", "id,name\n1,alpha\n2,\"bro");

    auto rows = recovery->recoverCSVFile(path);
    ASSERT_TRUE(rows.has_value());
    ASSERT_EQ(rows->size(), 1u);
    EXPECT_EQ((*rows)[0].at("id"), "1");
}

TEST_F(DataRecoveryTest, RecoverCSVFile_Unrecoverable) {
    EXPECT_FALSE(recovery->recoverCSVFile(writeFile("header.csv", "id,name\n")).has_value());
    EXPECT_FALSE(recovery->recoverCSVFile(writeFile("nul.csv", String("id\n1\0\n", 6))).has_value());
    EXPECT_FALSE(recovery->recoverCSVFile(writeFile("ragged.csv", "a,b\n1\n2,3,4\n")).has_value());
}

TEST_F(DataRecoveryTest, ClearCache_BothFormats) {
    ASSERT_TRUE(recovery->recoverJSONFile(writeFile("a.json", "{\"x\":1}\n")).has_value());
    ASSERT_TRUE(recovery->recoverCSVFile(writeFile("a.csv", "x\n1\n")).has_value());
    EXPECT_EQ(recovery->cacheSize(), 2u);

    recovery->clearCache();
    EXPECT_EQ(recovery->cacheSize(), 0u);
}
