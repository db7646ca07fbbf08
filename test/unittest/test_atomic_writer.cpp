/**
 * @file test_atomic_writer.cpp
 * @brief Unit tests for CAtomicWriter
 * @date 2025-12-01
 */

#include <gtest/gtest.h>
#include <lap/core/CPath.hpp>
#include <lap/core/CFile.hpp>
#include <lap/core/CMemory.hpp>
#include "CAtomicWriter.hpp"

using namespace lap::rds;
using namespace lap::core;

class AtomicWriterTest : public ::testing::Test {
protected:
    const String testDir = "/tmp/rds_atomic_writer_test";
    UniqueHandle<CAtomicWriter> writer;

    void SetUp() override {
        if (Path::isDirectory(testDir)) {
            Path::removeDirectory(testDir, true);
        }
        Path::createDirectory(testDir);
        writer = MakeUnique<CAtomicWriter>(".tmp", true);
    }

    void TearDown() override {
        writer.reset();
        if (Path::isDirectory(testDir)) {
            Path::removeDirectory(testDir, true);
        }
    }

    String readBack(const String& path) {
        String content;
        EXPECT_TRUE(readFileText(path, content));
        return content;
    }
};

TEST_F(AtomicWriterTest, WriteJSON_CompactByDefault) {
    String path = testDir + "/data.json";
    Json value = {{"b", 2}, {"a", {1, 2}}};

    ASSERT_TRUE(writer->writeJSONAtomic(value, path).HasValue());
    EXPECT_EQ(readBack(path), "{\"a\":[1,2],\"b\":2}");
    EXPECT_FALSE(File::Util::exists(writer->tempPathFor(path)));
}

TEST_F(AtomicWriterTest, WriteJSON_Indented) {
    String path = testDir + "/pretty.json";
    ASSERT_TRUE(writer->writeJSONAtomic(Json{{"k", 1}}, path, 2).HasValue());
    EXPECT_EQ(readBack(path), "{\n  \"k\": 1\n}");
}

TEST_F(AtomicWriterTest, WriteJSON_ReplacesExisting) {
    String path = testDir + "/data.json";
    ASSERT_TRUE(writer->writeJSONAtomic(Json{{"v", 1}}, path).HasValue());
    ASSERT_TRUE(writer->writeJSONAtomic(Json{{"v", 22}}, path).HasValue());
    EXPECT_EQ(Json::parse(readBack(path))["v"], 22);
}

TEST_F(AtomicWriterTest, WriteJSON_CreatesParentDirectory) {
    String path = testDir + "/nested/data.json";
    ASSERT_TRUE(writer->writeJSONAtomic(Json::array(), path).HasValue());
    EXPECT_EQ(readBack(path), "[]");
}

TEST_F(AtomicWriterTest, WriteJSONLines_OneRecordPerLine) {
    String path = testDir + "/records.jsonl";
    Json records = Json::array({Json{{"a", 1}}, Json{{"b", "x"}}, 3});

    ASSERT_TRUE(writer->writeJSONLinesAtomic(records, path).HasValue());
    EXPECT_EQ(readBack(path), "{\"a\":1}\n{\"b\":\"x\"}\n3\n");
}

TEST_F(AtomicWriterTest, WriteJSONLines_EmptyArrayGivesEmptyFile) {
    String path = testDir + "/empty.jsonl";
    ASSERT_TRUE(writer->writeJSONLinesAtomic(Json::array(), path).HasValue());
    EXPECT_TRUE(File::Util::exists(path));
    EXPECT_EQ(File::Util::size(path), 0u);
}

TEST_F(AtomicWriterTest, WriteCSV_HeaderFromFirstRecord) {
    String path = testDir + "/table.csv";
    Json records = Json::array({
        Json{{"id", 1}, {"name", "alpha"}},
        Json{{"id", 2}, {"extra", "ignored"}},
        Json{{"id", 3}, {"name", "a,b"}}
    });

    ASSERT_TRUE(writer->writeCSVAtomic(records, path).HasValue());
    EXPECT_EQ(readBack(path), "id,name\n1,alpha\n2,\n3,\"a,b\"\n");
}

TEST_F(AtomicWriterTest, WriteCSV_RejectsNonArray) {
    String path = testDir + "/table.csv";
    auto result = writer->writeCSVAtomic(Json{{"id", 1}}, path);

    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), static_cast<Int32>(RdsErrc::kInvalidArgument));
    EXPECT_FALSE(File::Util::exists(path));
}

TEST_F(AtomicWriterTest, FailureBeforeRename_LeavesTargetUntouched) {
    String path = testDir + "/data.json";
    ASSERT_TRUE(writer->writeJSONAtomic(Json{{"v", "original"}}, path).HasValue());
    String before = readBack(path);

    String seenTemp;
    writer->setPreRenameHook([&seenTemp](const String& tempPath) {
        seenTemp = tempPath;
        return false;
    });

    auto result = writer->writeJSONAtomic(Json{{"v", "replacement"}}, path);
    EXPECT_FALSE(result.HasValue());
    EXPECT_EQ(seenTemp, writer->tempPathFor(path));

    EXPECT_EQ(readBack(path), before);
    EXPECT_FALSE(File::Util::exists(writer->tempPathFor(path)));
}

TEST_F(AtomicWriterTest, FailureBeforeRename_NoTargetCreated) {
    String path = testDir + "/fresh.json";
    writer->setPreRenameHook([](const String&) { return false; });

    EXPECT_FALSE(writer->writeJSONAtomic(Json{{"v", 1}}, path).HasValue());
    EXPECT_FALSE(File::Util::exists(path));
    EXPECT_FALSE(File::Util::exists(writer->tempPathFor(path)));

    writer->setPreRenameHook(nullptr);
    EXPECT_TRUE(writer->writeJSONAtomic(Json{{"v", 1}}, path).HasValue());
}

TEST_F(AtomicWriterTest, RenameOntoDirectory_Fails) {
    String path = testDir + "/occupied";
    ASSERT_TRUE(Path::createDirectory(path));

    auto result = writer->writeTextAtomic("payload", path);
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), static_cast<Int32>(RdsErrc::kRenameFailed));
    EXPECT_FALSE(File::Util::exists(writer->tempPathFor(path)));
}

TEST_F(AtomicWriterTest, EmptyPath_Rejected) {
    auto result = writer->writeTextAtomic("x", "");
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), static_cast<Int32>(RdsErrc::kInvalidArgument));
}
