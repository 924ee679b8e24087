#include "gtest/gtest.h"
#include "sandbox/output_buffer.hpp"

using namespace std;
using namespace coexec::sandbox;

static void append(output_buffer &buffer, const string &data) {
    buffer.append(data.data(), data.size());
}

TEST(OutputBufferTest, KeepsShortOutput) {
    output_buffer buffer(10, 1024);
    append(buffer, "a\nb\n");
    EXPECT_EQ("a\nb\n", buffer.str());
    EXPECT_FALSE(buffer.truncated());
    EXPECT_EQ(4u, buffer.total_bytes());
}

TEST(OutputBufferTest, JoinsChunksAcrossLines) {
    output_buffer buffer(10, 1024);
    append(buffer, "hel");
    append(buffer, "lo\nwor");
    append(buffer, "ld\n");
    EXPECT_EQ("hello\nworld\n", buffer.str());
    EXPECT_FALSE(buffer.truncated());
}

TEST(OutputBufferTest, DropsOldestLines) {
    output_buffer buffer(3, 1024);
    append(buffer, "1\n2\n3\n4\n5\n");
    EXPECT_EQ("3\n4\n5\n", buffer.str());
    EXPECT_TRUE(buffer.truncated());
    EXPECT_EQ(10u, buffer.total_bytes());
}

TEST(OutputBufferTest, CountsUnterminatedLine) {
    output_buffer buffer(2, 1024);
    append(buffer, "1\n2\n3");
    EXPECT_EQ("2\n3", buffer.str());
    EXPECT_TRUE(buffer.truncated());
}

TEST(OutputBufferTest, CapsBytes) {
    output_buffer buffer(100, 4);
    append(buffer, "aa\nbb\ncc\n");
    EXPECT_EQ("cc\n", buffer.str());
    EXPECT_TRUE(buffer.truncated());
}

TEST(OutputBufferTest, KeepsTailOfLongLine) {
    output_buffer buffer(100, 4);
    append(buffer, "abcdefgh");
    EXPECT_EQ("efgh", buffer.str());
    EXPECT_TRUE(buffer.truncated());
}

TEST(OutputBufferTest, BoundsRunawayOutput) {
    output_buffer buffer(1000, 1 << 20);
    string line = "spam\n";
    for (int i = 0; i < 100000; ++i) append(buffer, line);
    EXPECT_EQ(1000 * line.size(), buffer.str().size());
    EXPECT_EQ(100000 * line.size(), buffer.total_bytes());
    EXPECT_TRUE(buffer.truncated());
}

TEST(OutputBufferTest, KeepsTailOfTerminatedLongLine) {
    output_buffer buffer(1000, 100);
    append(buffer, string(150, 'x') + "\n");
    EXPECT_EQ(string(99, 'x') + "\n", buffer.str());
    EXPECT_TRUE(buffer.truncated());
    EXPECT_EQ(151u, buffer.total_bytes());
}

TEST(OutputBufferTest, KeepsTailOfLongLineEndedLater) {
    output_buffer buffer(1000, 100);
    append(buffer, "first\n");
    append(buffer, string(150, 'y'));
    append(buffer, "\n");
    EXPECT_EQ(string(99, 'y') + "\n", buffer.str());
    EXPECT_TRUE(buffer.truncated());
}

TEST(OutputBufferTest, TruncatesOnCharacterBoundary) {
    output_buffer buffer(1000, 101);
    string text;
    for (int i = 0; i < 100; ++i) text += u8"é";
    append(buffer, text);
    string output = buffer.str();
    // 保留末尾 101 字节会切在字符中间，只能保留 50 个完整字符
    EXPECT_EQ(100u, output.size());
    EXPECT_EQ(text.substr(100), output);
    EXPECT_TRUE(buffer.truncated());
}

TEST(OutputBufferTest, ReplacesInvalidBytes) {
    output_buffer buffer(10, 1024);
    append(buffer, "ok\xff\n");
    append(buffer, "\xc3");
    EXPECT_EQ("ok\xEF\xBF\xBD\n\xEF\xBF\xBD", buffer.str());
}
