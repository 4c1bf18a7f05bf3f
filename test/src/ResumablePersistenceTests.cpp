/**
 * @file ResumablePersistenceTests.cpp
 *
 * This module contains the unit tests of the
 * AsyncHttp::PropertiesResumableProcessor and
 * AsyncHttp::ResumableFileListener classes.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/ResumableListener.hpp>
#include <AsyncHttp/ResumableProcessor.hpp>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <stdio.h>

namespace {

    /**
     * This is the name of the properties file used in these tests.
     */
    const std::string PROPERTIES_FILE_NAME = "ResumablePersistenceTests.properties";

    /**
     * This is the path of the download file used in these tests.
     */
    const std::string DOWNLOAD_FILE_PATH = "ResumablePersistenceTests.download";

    /**
     * This function returns the contents of the given file.
     */
    std::string ReadFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        return std::string(
            std::istreambuf_iterator< char >(file),
            std::istreambuf_iterator< char >()
        );
    }

}

/**
 * This is the test fixture for these tests, providing common
 * setup and teardown for each test.
 */
struct ResumablePersistenceTests
    : public ::testing::Test
{
    // ::testing::Test

    virtual void SetUp() {
        (void)remove(PROPERTIES_FILE_NAME.c_str());
        (void)remove(DOWNLOAD_FILE_PATH.c_str());
    }

    virtual void TearDown() {
        (void)remove(PROPERTIES_FILE_NAME.c_str());
        (void)remove(DOWNLOAD_FILE_PATH.c_str());
    }
};

TEST_F(ResumablePersistenceTests, PropertiesPath) {
    AsyncHttp::PropertiesResumableProcessor processor(".", PROPERTIES_FILE_NAME);
    EXPECT_EQ("./" + PROPERTIES_FILE_NAME, processor.GetPath());
    AsyncHttp::PropertiesResumableProcessor slashed("downloads/", "state.properties");
    EXPECT_EQ("downloads/state.properties", slashed.GetPath());
}

TEST_F(ResumablePersistenceTests, NothingStoredLoadsEmpty) {
    AsyncHttp::PropertiesResumableProcessor processor(".", PROPERTIES_FILE_NAME);
    EXPECT_TRUE(processor.Load().empty());
}

TEST_F(ResumablePersistenceTests, SavedOffsetsLoadInAnotherInstance) {
    const std::map< std::string, int64_t > offsets{
        {"http://www.example.com/a.iso", 4096},
        {"http://www.example.com/b?x=1&y=2", 12},
    };
    {
        AsyncHttp::PropertiesResumableProcessor processor(".", PROPERTIES_FILE_NAME);
        processor.Put("http://www.example.com/a.iso", 4096);
        ASSERT_TRUE(processor.Save(offsets));
    }
    AsyncHttp::PropertiesResumableProcessor processor(".", PROPERTIES_FILE_NAME);
    EXPECT_EQ(offsets, processor.Load());
}

TEST_F(ResumablePersistenceTests, KeysWithLineBreaksNotSaved) {
    AsyncHttp::PropertiesResumableProcessor processor(".", PROPERTIES_FILE_NAME);
    ASSERT_TRUE(
        processor.Save({
            {"good", 1},
            {"bad\nkey", 2},
        })
    );
    EXPECT_EQ("good=1\n", ReadFile(PROPERTIES_FILE_NAME));
}

TEST_F(ResumablePersistenceTests, MalformedLinesSkipped) {
    {
        std::ofstream file(PROPERTIES_FILE_NAME, std::ios::binary);
        file
            << "good=5\r\n"
            << "noequals\n"
            << "=7\n"
            << "text=xyz\n"
            << "negative=-3\n"
            << "\n"
            << "last=9\n";
    }
    AsyncHttp::PropertiesResumableProcessor processor(".", PROPERTIES_FILE_NAME);
    EXPECT_EQ(
        (std::map< std::string, int64_t >{
            {"good", 5},
            {"last", 9},
        }),
        processor.Load()
    );
}

TEST_F(ResumablePersistenceTests, UnwritableLocationFailsToSave) {
    AsyncHttp::PropertiesResumableProcessor processor("no/such/directory", PROPERTIES_FILE_NAME);
    EXPECT_FALSE(processor.Save({{"key", 1}}));
}

TEST_F(ResumablePersistenceTests, NullProcessor) {
    AsyncHttp::NullResumableProcessor processor;
    processor.Put("key", 1);
    EXPECT_TRUE(processor.Save({{"key", 1}}));
    EXPECT_TRUE(processor.Load().empty());
}

TEST_F(ResumablePersistenceTests, FileListenerAppends) {
    {
        AsyncHttp::ResumableFileListener listener(DOWNLOAD_FILE_PATH);
        EXPECT_EQ(0, listener.GetLength());
        EXPECT_TRUE(listener.OnBytesReceived({'H', 'e', 'l', 'l', 'o'}));
        EXPECT_EQ(5, listener.GetLength());
        listener.OnAllBytesReceived();
    }
    AsyncHttp::ResumableFileListener listener(DOWNLOAD_FILE_PATH);
    EXPECT_EQ(5, listener.GetLength());
    EXPECT_TRUE(listener.OnBytesReceived({',', ' ', 'W', 'o', 'r', 'l', 'd'}));
    listener.OnAllBytesReceived();
    EXPECT_EQ(12, listener.GetLength());
    EXPECT_EQ("Hello, World", ReadFile(DOWNLOAD_FILE_PATH));
}

TEST_F(ResumablePersistenceTests, FileListenerUnwritableLocation) {
    AsyncHttp::ResumableFileListener listener("no/such/directory/file.bin");
    EXPECT_FALSE(listener.OnBytesReceived({'x'}));
}

TEST_F(ResumablePersistenceTests, NullListenerReportsNoLength) {
    AsyncHttp::NullResumableListener listener;
    EXPECT_TRUE(listener.OnBytesReceived({'a', 'b', 'c'}));
    EXPECT_TRUE(listener.OnBytesReceived({'d'}));
    EXPECT_EQ(0, listener.GetLength());
}
