/**
 * @file test_stream_assembler.cpp
 * @brief Unit tests for frame reassembly over a byte stream
 * @author Lectern Network Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Lectern Project. All rights reserved.
 */

#include <gtest/gtest.h>
#include <Lectern/Core/StreamAssembler.hpp>
#include "TestHarness.hpp"

#include <algorithm>

using namespace Lectern;
using namespace Lectern::Protocol;
using namespace Lectern::Testing;

class StreamAssemblerTest : public ::testing::Test {
protected:
    ByteBuffer makeFrame(const std::string& content) {
        MessageData data;
        data["content"] = content;
        auto frame = pack(MessageType::ChatMessage, data);
        EXPECT_TRUE(frame.isSuccess());
        return frame.value();
    }

    static void append(ByteBuffer& stream, const ByteBuffer& bytes) {
        stream.insert(stream.end(), bytes.begin(), bytes.end());
    }

    StreamAssembler assembler;
};

TEST_F(StreamAssemblerTest, SingleFrame) {
    ByteBuffer frame = makeFrame("one");

    auto frames = assembler.feed(frame);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], frame);
    EXPECT_EQ(assembler.bufferedBytes(), 0u);
    EXPECT_EQ(assembler.statistics().framesAssembled, 1u);
    EXPECT_EQ(assembler.statistics().bytesProcessed, frame.size());
}

TEST_F(StreamAssemblerTest, ByteByByteDelivery) {
    ByteBuffer frame = makeFrame("dribble");

    std::vector<ByteBuffer> frames;
    for (size_t i = 0; i < frame.size(); i++) {
        auto out = assembler.feed(ByteSpan(frame).subspan(i, 1));
        if (i + 1 < frame.size()) {
            EXPECT_TRUE(out.empty()) << "frame emitted early at byte " << i;
        }
        frames.insert(frames.end(), out.begin(), out.end());
    }

    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], frame);
}

TEST_F(StreamAssemblerTest, SeveralFramesInOneChunk) {
    ByteBuffer a = makeFrame("a");
    ByteBuffer b = makeFrame("bb");
    ByteBuffer c = makeFrame("ccc");

    ByteBuffer stream;
    append(stream, a);
    append(stream, b);
    append(stream, c);

    auto frames = assembler.feed(stream);
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0], a);
    EXPECT_EQ(frames[1], b);
    EXPECT_EQ(frames[2], c);
}

TEST_F(StreamAssemblerTest, FrameSplitAcrossChunks) {
    ByteBuffer a = makeFrame("first");
    ByteBuffer b = makeFrame("second");

    ByteBuffer stream;
    append(stream, a);
    append(stream, b);

    // Split inside the second header
    size_t split = a.size() + 5;
    auto first = assembler.feed(ByteSpan(stream).first(split));
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0], a);
    EXPECT_EQ(assembler.bufferedBytes(), 5u);

    auto second = assembler.feed(ByteSpan(stream).subspan(split));
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0], b);
    EXPECT_EQ(assembler.bufferedBytes(), 0u);
}

TEST_F(StreamAssemblerTest, ResynchronizesAfterGarbage) {
    ByteBuffer frame = makeFrame("after garbage");

    ByteBuffer stream{0x01, 0x02, 0x03, 'x', 'y', 'z', 0x00, 0x10, 0x20, 0x30, 0x40, 0x50, 0x60};
    append(stream, frame);

    auto frames = assembler.feed(stream);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], frame);
    EXPECT_EQ(assembler.statistics().syncRecoveries, 1u);

    auto message = unpack(frames[0]);
    ASSERT_LECTERN_SUCCESS(message);
    EXPECT_EQ(message.value().data["content"], "after garbage");
}

TEST_F(StreamAssemblerTest, GarbageWithoutMagicKeepsTail) {
    ByteBuffer garbage(64, 0x55);

    auto frames = assembler.feed(garbage);
    EXPECT_TRUE(frames.empty());
    // Only a possible partial magic is retained
    EXPECT_EQ(assembler.bufferedBytes(), MAGIC.size() - 1);
}

TEST_F(StreamAssemblerTest, MagicSplitAcrossChunks) {
    ByteBuffer frame = makeFrame("split magic");

    ByteBuffer first(40, 0x11);
    first.push_back('A');
    first.push_back('F');

    EXPECT_TRUE(assembler.feed(first).empty());

    auto frames = assembler.feed(ByteSpan(frame).subspan(2));
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], frame);
}

TEST_F(StreamAssemblerTest, OversizedHeaderIsSkipped) {
    ByteBuffer bogus{'A', 'F', 'R', 'D', 0x00, 0x02, 0x7F, 0x00, 0x00, 0x00, 0x00};
    ByteBuffer frame = makeFrame("survivor");

    ByteBuffer stream = bogus;
    append(stream, frame);

    auto frames = assembler.feed(stream);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], frame);
    EXPECT_EQ(assembler.statistics().oversizedRejected, 1u);
}

TEST_F(StreamAssemblerTest, CustomPayloadCeiling) {
    StreamAssembler small(16);

    ByteBuffer frame = makeFrame(std::string(64, 'q'));
    auto frames = small.feed(frame);
    EXPECT_TRUE(frames.empty());
    EXPECT_EQ(small.statistics().oversizedRejected, 1u);
    EXPECT_EQ(small.maxPayloadSize(), 16u);
}

TEST_F(StreamAssemblerTest, LargeCompressedFrame) {
    ByteBuffer frame = makeFrame(std::string(50000, 'k'));
    auto header = parseHeader(frame);
    ASSERT_TRUE(header.has_value());
    ASSERT_TRUE(header->compressed);

    // Feed in irregular pieces
    std::vector<ByteBuffer> frames;
    size_t offset = 0;
    size_t step = 1;
    while (offset < frame.size()) {
        size_t n = std::min(step, frame.size() - offset);
        auto out = assembler.feed(ByteSpan(frame).subspan(offset, n));
        frames.insert(frames.end(), out.begin(), out.end());
        offset += n;
        step = step * 3 + 1;
    }

    ASSERT_EQ(frames.size(), 1u);
    auto message = unpack(frames[0]);
    ASSERT_LECTERN_SUCCESS(message);
    EXPECT_EQ(message.value().data["content"].get<std::string>().size(), 50000u);
}

TEST_F(StreamAssemblerTest, ClearDropsPartialFrameKeepsStatistics) {
    ByteBuffer a = makeFrame("complete");
    ByteBuffer b = makeFrame("partial");

    ASSERT_EQ(assembler.feed(a).size(), 1u);
    EXPECT_TRUE(assembler.feed(ByteSpan(b).first(b.size() - 1)).empty());
    EXPECT_GT(assembler.bufferedBytes(), 0u);

    assembler.clear();
    EXPECT_EQ(assembler.bufferedBytes(), 0u);
    EXPECT_EQ(assembler.statistics().framesAssembled, 1u);

    // The tail of the dropped frame is garbage now
    ByteBuffer stream(b.end() - 1, b.end());
    ByteBuffer c = makeFrame("fresh");
    append(stream, c);

    auto frames = assembler.feed(stream);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], c);
}

TEST_F(StreamAssemblerTest, EmptyChunkIsNoOp) {
    EXPECT_TRUE(assembler.feed(ByteSpan()).empty());
    EXPECT_EQ(assembler.statistics().bytesProcessed, 0u);
}

TEST_F(StreamAssemblerTest, FuzzedStreamNeverCrashes) {
    SimpleFuzzer fuzzer(7);
    ByteBuffer frame = makeFrame("needle");

    for (int i = 0; i < 200; i++) {
        ByteBuffer noise = fuzzer.generate(0, 128);
        (void)assembler.feed(noise);
    }

    // Whatever is buffered, a clear plus a valid frame always decodes
    assembler.clear();
    auto frames = assembler.feed(frame);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], frame);
}
