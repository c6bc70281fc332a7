#include <gtest/gtest.h>

#include "devrun/process/output_ring_buffer.h"

using namespace devrun;

TEST(OutputRingBufferTest, SplitsLinesAcrossChunks) {
    OutputRingBuffer buf;
    buf.appendStdout("hel");
    buf.appendStdout("lo\nwor");
    buf.appendStdout("ld\n");

    EXPECT_EQ(buf.tail(), (QStringList{"hello", "world"}));
    EXPECT_EQ(buf.lineCount(), 2);
}

TEST(OutputRingBufferTest, StderrLinesArePrefixed) {
    OutputRingBuffer buf;
    buf.appendStdout("out\n");
    buf.appendStderr("boom\r\n");

    EXPECT_EQ(buf.tail(), (QStringList{"out", "[stderr] boom"}));
}

TEST(OutputRingBufferTest, ChannelsKeepSeparatePartialLines) {
    OutputRingBuffer buf;
    buf.appendStdout("std");
    buf.appendStderr("err");
    buf.appendStdout("out\n");
    buf.appendStderr("or\n");

    EXPECT_EQ(buf.tail(), (QStringList{"stdout", "[stderr] error"}));
}

TEST(OutputRingBufferTest, DropsOldestBeyondCapacity) {
    OutputRingBuffer buf(3);
    for (int i = 0; i < 5; ++i) {
        buf.appendStdout(QByteArray::number(i) + "\n");
    }

    EXPECT_EQ(buf.tail(), (QStringList{"2", "3", "4"}));
    EXPECT_EQ(buf.droppedLines(), 2);
}

TEST(OutputRingBufferTest, TailIncludesUnterminatedRemainder) {
    OutputRingBuffer buf;
    buf.appendStdout("a\nb\npartial");

    EXPECT_EQ(buf.tail(2), (QStringList{"b", "partial"}));
}

TEST(OutputRingBufferTest, OverlongLineWithoutNewlineIsFlushed) {
    OutputRingBuffer buf;
    buf.appendStdout(QByteArray(OutputRingBuffer::kMaxPartialBytes + 10, 'x'));

    EXPECT_EQ(buf.lineCount(), 1);
}

TEST(OutputRingBufferTest, ClearResetsEverything) {
    OutputRingBuffer buf;
    buf.appendStdout("a\nb");
    buf.clear();

    EXPECT_TRUE(buf.tail().isEmpty());
    EXPECT_EQ(buf.lineCount(), 0);
}
