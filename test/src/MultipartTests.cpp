/**
 * @file MultipartTests.cpp
 *
 * This module contains the unit tests of the multipart/form-data
 * body encoder.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/Multipart.hpp>
#include <gtest/gtest.h>

namespace {

    /**
     * This function concatenates the given blocks into a string.
     */
    std::string Concatenate(const std::vector< std::vector< uint8_t > >& blocks) {
        std::string result;
        for (const auto& block: blocks) {
            result.append(block.begin(), block.end());
        }
        return result;
    }

}

TEST(MultipartTests, ExtractBoundary) {
    std::string boundary;
    EXPECT_TRUE(AsyncHttp::ExtractBoundary("multipart/form-data; boundary=abc123", boundary));
    EXPECT_EQ("abc123", boundary);
    EXPECT_TRUE(AsyncHttp::ExtractBoundary("multipart/form-data; boundary=\"q r\"; charset=utf-8", boundary));
    EXPECT_EQ("q r", boundary);
    EXPECT_FALSE(AsyncHttp::ExtractBoundary("multipart/form-data", boundary));
    EXPECT_FALSE(AsyncHttp::ExtractBoundary("", boundary));
}

TEST(MultipartTests, NewBoundaryIsRandom) {
    std::string first;
    std::string second;
    ASSERT_TRUE(AsyncHttp::NewBoundary(first));
    ASSERT_TRUE(AsyncHttp::NewBoundary(second));
    EXPECT_EQ(32u, first.length());
    EXPECT_NE(first, second);
}

TEST(MultipartTests, EncodeParts) {
    AsyncHttp::Part field;
    field.name = "comment";
    field.content = {'h', 'i'};
    AsyncHttp::Part file;
    file.name = "upload";
    file.fileName = "notes.txt";
    file.contentType = "text/plain";
    file.content = {'a', 'b', 'c'};
    const auto blocks = AsyncHttp::EncodeMultipart({field, file}, "XyZ");
    EXPECT_EQ(7u, blocks.size());
    EXPECT_EQ(
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"comment\"\r\n"
        "\r\n"
        "hi\r\n"
        "--XyZ\r\n"
        "Content-Disposition: form-data; name=\"upload\"; filename=\"notes.txt\"\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "abc\r\n"
        "--XyZ--\r\n",
        Concatenate(blocks)
    );
}
