#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "mock_line_source.hpp"
#include "pipeline/line_chunker.hpp"
#include "source/stream_line_source.hpp"
#include "test_utils.hpp"

using namespace chunkline::pipeline;
using chunkline::source::ReadStatus;
using chunkline::source::StreamLineSource;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

class LineChunkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging(boost::log::trivial::fatal);
    }

    std::unique_ptr<LineChunker> make_chunker(const std::string& text, std::size_t chunk_size) {
        return std::make_unique<LineChunker>(StreamLineSource::from_string(text), chunk_size, cancel, state);
    }

    // Mock ownership passes to the chunker; expectations are checked when it is destroyed
    std::unique_ptr<LineChunker> make_chunker(std::unique_ptr<MockLineSource> source, std::size_t chunk_size) {
        return std::make_unique<LineChunker>(std::move(source), chunk_size, cancel, state);
    }

    static std::vector<LineChunk> drain(LineChunker& chunker) {
        std::vector<LineChunk> chunks;
        LineChunk chunk;
        while (chunker.next(chunk)) {
            chunks.push_back(chunk);
        }
        return chunks;
    }

    CancelSignal cancel;
    PipelineState state;
};

TEST_F(LineChunkerTest, GroupsLinesIntoNumberedChunks) {
    auto chunker = make_chunker("1\n2\n3\n4\n5\n", 2);
    auto chunks = drain(*chunker);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].id, 0u);
    EXPECT_EQ(chunks[0].lines, (std::vector<std::string>{"1\n", "2\n"}));
    EXPECT_EQ(chunks[1].id, 1u);
    EXPECT_EQ(chunks[1].lines, (std::vector<std::string>{"3\n", "4\n"}));
    EXPECT_EQ(chunks[2].id, 2u);
    EXPECT_EQ(chunks[2].lines, (std::vector<std::string>{"5\n"}));
    for (const auto& chunk : chunks) {
        EXPECT_FALSE(chunk.is_terminal());
    }

    EXPECT_TRUE(chunker->done());
    EXPECT_EQ(chunker->lines_read(), 5u);
    EXPECT_EQ(chunker->chunks_emitted(), 3u);
    EXPECT_EQ(state.get_reason(), PipelineState::Reason::END_OF_STREAM);
}

TEST_F(LineChunkerTest, ExactMultipleEndsWithEmptyChunk) {
    auto chunker = make_chunker("a\nb\nc\nd\n", 2);
    auto chunks = drain(*chunker);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[2].id, 2u);
    EXPECT_TRUE(chunks[2].lines.empty());
    EXPECT_FALSE(chunks[2].is_terminal());
}

TEST_F(LineChunkerTest, EmptySourceYieldsSingleEmptyChunk) {
    auto chunker = make_chunker("", 3);
    auto chunks = drain(*chunker);

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].id, 0u);
    EXPECT_TRUE(chunks[0].lines.empty());
}

TEST_F(LineChunkerTest, ZeroChunkSizeIsClamped) {
    auto chunker = make_chunker("a\nb\n", 0);
    EXPECT_EQ(chunker->chunk_size(), 1u);
    EXPECT_EQ(drain(*chunker).size(), 3u);
}

TEST_F(LineChunkerTest, ReadFailureTagsFinalChunk) {
    auto source = std::make_unique<NiceMock<MockLineSource>>();
    EXPECT_CALL(*source, read_line(_))
        .WillOnce(DoAll(SetArgReferee<0>(std::string("a\n")), Return(ReadStatus::LINE)))
        .WillOnce(DoAll(SetArgReferee<0>(std::string("b\n")), Return(ReadStatus::LINE)))
        .WillOnce(DoAll(SetArgReferee<0>(std::string("c\n")), Return(ReadStatus::LINE)))
        .WillOnce(Return(ReadStatus::ERROR));
    ON_CALL(*source, last_error()).WillByDefault(Return("device unplugged"));
    EXPECT_CALL(*source, close()).Times(1);

    auto chunker = make_chunker(std::move(source), 2);
    auto chunks = drain(*chunker);

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_FALSE(chunks[0].is_terminal());
    EXPECT_EQ(chunks[1].lines, (std::vector<std::string>{"c\n"}));
    ASSERT_TRUE(chunks[1].status.has_value());
    EXPECT_EQ(chunks[1].status->code, ErrorCode::SOURCE_FAILED);
    EXPECT_EQ(chunks[1].status->message, "device unplugged");
    EXPECT_EQ(state.get_reason(), PipelineState::Reason::SOURCE_ERROR);
}

TEST_F(LineChunkerTest, CancelBeforeFirstReadSkipsTheSource) {
    auto source = std::make_unique<NiceMock<MockLineSource>>();
    EXPECT_CALL(*source, read_line(_)).Times(0);
    EXPECT_CALL(*source, close()).Times(1);

    auto chunker = make_chunker(std::move(source), 4);
    cancel.request();
    auto chunks = drain(*chunker);

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].id, 0u);
    EXPECT_TRUE(chunks[0].lines.empty());
    ASSERT_TRUE(chunks[0].status.has_value());
    EXPECT_EQ(*chunks[0].status, cancelled_error());
    EXPECT_EQ(state.get_reason(), PipelineState::Reason::CANCELLED);
}

// Lines already read when the signal arrives stay in the cancellation chunk
TEST_F(LineChunkerTest, CancelMidChunkKeepsBufferedLines) {
    auto source = std::make_unique<NiceMock<MockLineSource>>();
    EXPECT_CALL(*source, read_line(_))
        .WillOnce(DoAll(SetArgReferee<0>(std::string("1\n")), Return(ReadStatus::LINE)))
        .WillOnce(Invoke([this](std::string& line) {
            line = "2\n";
            cancel.request();
            return ReadStatus::LINE;
        }));
    EXPECT_CALL(*source, close()).Times(1);

    auto chunker = make_chunker(std::move(source), 5);
    auto chunks = drain(*chunker);

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].lines, (std::vector<std::string>{"1\n", "2\n"}));
    ASSERT_TRUE(chunks[0].status.has_value());
    EXPECT_TRUE(chunks[0].status->is_cancellation());
}

TEST_F(LineChunkerTest, CancelBetweenChunksNumbersNextChunk) {
    auto chunker = make_chunker("a\nb\nc\nd\ne\n", 2);
    LineChunk chunk;
    ASSERT_TRUE(chunker->next(chunk));
    EXPECT_EQ(chunk.id, 0u);

    cancel.request();
    ASSERT_TRUE(chunker->next(chunk));
    EXPECT_EQ(chunk.id, 1u);
    EXPECT_TRUE(chunk.lines.empty());
    EXPECT_TRUE(chunk.is_terminal());
    EXPECT_FALSE(chunker->next(chunk));
    EXPECT_EQ(chunker->lines_read(), 2u);
}

TEST_F(LineChunkerTest, StopsWithoutChunkAfterPipelineError) {
    auto source = std::make_unique<NiceMock<MockLineSource>>();
    EXPECT_CALL(*source, read_line(_)).Times(0);
    EXPECT_CALL(*source, close()).Times(1);

    auto chunker = make_chunker(std::move(source), 2);
    state.raise_error();

    LineChunk chunk;
    EXPECT_FALSE(chunker->next(chunk));
    EXPECT_TRUE(chunker->done());
}

TEST_F(LineChunkerTest, SourceClosedOnceEvenIfNeverRead) {
    auto source = std::make_unique<NiceMock<MockLineSource>>();
    EXPECT_CALL(*source, close()).Times(1);
    auto chunker = make_chunker(std::move(source), 2);
    chunker.reset();
}

TEST_F(LineChunkerTest, RunPublishesAllChunksAndCloses) {
    auto chunker = make_chunker("a\nb\nc\n", 1);
    Channel<LineChunk> out(8);
    chunker->run(out);

    EXPECT_TRUE(out.closed());
    std::vector<SequenceNumber> ids;
    LineChunk chunk;
    while (out.consume(chunk)) {
        ids.push_back(chunk.id);
    }
    EXPECT_EQ(ids, (std::vector<SequenceNumber>{0, 1, 2, 3}));
}

TEST_F(LineChunkerTest, RunStopsWhenDownstreamCloses) {
    auto source = std::make_unique<NiceMock<MockLineSource>>();
    ON_CALL(*source, read_line(_))
        .WillByDefault(DoAll(SetArgReferee<0>(std::string("x\n")), Return(ReadStatus::LINE)));
    EXPECT_CALL(*source, close()).Times(1);

    auto chunker = make_chunker(std::move(source), 1);
    Channel<LineChunk> out(2);
    out.close();
    chunker->run(out);

    EXPECT_TRUE(chunker->done());
    EXPECT_LE(chunker->lines_read(), 1u);
}
