#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <thread>
#include <vector>
#include "pipeline/collector.hpp"
#include "test_utils.hpp"

using namespace chunkline::pipeline;

namespace {

ResultChunk<int> result(SequenceNumber id) {
    ResultChunk<int> chunk;
    chunk.id = id;
    chunk.data = {static_cast<int>(id)};
    return chunk;
}

ResultChunk<int> failed(SequenceNumber id, ErrorCode code = ErrorCode::TRANSFORM_FAILED) {
    ResultChunk<int> chunk = result(id);
    chunk.error = ChunkError{code, "chunk " + std::to_string(id)};
    return chunk;
}

} // namespace

class CollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging(boost::log::trivial::fatal);
    }

    // Everything currently published, in order
    std::vector<ResultChunk<int>> published() {
        std::vector<ResultChunk<int>> chunks;
        ResultChunk<int> chunk;
        while (collector.output().try_consume(chunk) == Channel<ResultChunk<int>>::PollStatus::READY) {
            chunks.push_back(chunk);
        }
        return chunks;
    }

    static std::vector<SequenceNumber> ids(const std::vector<ResultChunk<int>>& chunks) {
        std::vector<SequenceNumber> out;
        for (const auto& chunk : chunks) {
            out.push_back(chunk.id);
        }
        return out;
    }

    Collector<int> collector{64};
};

TEST_F(CollectorTest, ForwardsInOrderChunksImmediately) {
    collector.accept(result(0));
    collector.accept(result(1));

    EXPECT_EQ(ids(published()), (std::vector<SequenceNumber>{0, 1}));
    EXPECT_EQ(collector.next_expected(), 2u);
    EXPECT_EQ(collector.pending(), 0u);
}

TEST_F(CollectorTest, HoldsEarlyChunksUntilGapFills) {
    collector.accept(result(2));
    collector.accept(result(1));
    EXPECT_TRUE(published().empty());
    EXPECT_EQ(collector.pending(), 2u);

    collector.accept(result(0));
    EXPECT_EQ(ids(published()), (std::vector<SequenceNumber>{0, 1, 2}));
    EXPECT_EQ(collector.pending(), 0u);
}

TEST_F(CollectorTest, ListenerSeesEachNewNextExpected) {
    std::vector<SequenceNumber> reported;
    collector.set_forward_listener([&reported](SequenceNumber next_expected) {
        reported.push_back(next_expected);
    });

    collector.accept(result(1));
    EXPECT_TRUE(reported.empty());
    collector.accept(result(0));
    collector.accept(result(2));
    collector.accept(failed(3));
    EXPECT_EQ(reported, (std::vector<SequenceNumber>{1, 2, 3}));

    // The held error chunk is reported once flushed
    collector.flush();
    EXPECT_EQ(reported, (std::vector<SequenceNumber>{1, 2, 3, 4}));
}

TEST_F(CollectorTest, IgnoresDuplicates) {
    collector.accept(result(0));
    collector.accept(result(2));
    collector.accept(result(0));
    collector.accept(result(2));

    EXPECT_EQ(ids(published()), (std::vector<SequenceNumber>{0}));
    EXPECT_EQ(collector.pending(), 1u);
}

// Lower chunks still in flight go out first, the error chunk last, later chunks never
TEST_F(CollectorTest, ErrorChunkEndsTheSequence) {
    collector.accept(result(0));
    collector.accept(failed(2));
    collector.accept(result(3));
    collector.accept(result(1));
    collector.flush();
    collector.finish();

    auto chunks = published();
    EXPECT_EQ(ids(chunks), (std::vector<SequenceNumber>{0, 1, 2}));
    ASSERT_TRUE(chunks.back().error.has_value());
    EXPECT_EQ(chunks.back().error->code, ErrorCode::TRANSFORM_FAILED);
    EXPECT_TRUE(collector.output().closed());
    EXPECT_TRUE(collector.state().is_finished());
}

TEST_F(CollectorTest, EarlierErrorReplacesLaterOne) {
    collector.accept(result(0));
    collector.accept(result(2));
    collector.accept(failed(3));
    collector.accept(failed(1, ErrorCode::SOURCE_FAILED));
    collector.flush();

    auto chunks = published();
    EXPECT_EQ(ids(chunks), (std::vector<SequenceNumber>{0, 1}));
    ASSERT_TRUE(chunks.back().error.has_value());
    EXPECT_EQ(chunks.back().error->code, ErrorCode::SOURCE_FAILED);
}

TEST_F(CollectorTest, BufferedChunksPastErrorAreDropped) {
    collector.accept(result(4));
    collector.accept(result(5));
    collector.accept(failed(3));
    EXPECT_EQ(collector.pending(), 0u);
}

TEST_F(CollectorTest, FlushPublishesGappedTailInOrder) {
    collector.accept(result(0));
    collector.accept(result(3));
    collector.accept(result(2));
    collector.flush();

    EXPECT_EQ(ids(published()), (std::vector<SequenceNumber>{0, 2, 3}));
}

TEST_F(CollectorTest, FinishClosesOutputOnce) {
    collector.finish();
    EXPECT_TRUE(collector.output().closed());
    EXPECT_TRUE(collector.state().is_finished());
    EXPECT_EQ(collector.state().get_reason(), PipelineState::Reason::END_OF_STREAM);

    collector.finish();
    EXPECT_TRUE(collector.state().is_finished());
}

TEST_F(CollectorTest, RunRestoresOrderFromShuffledArrivals) {
    const int count = 50;
    std::vector<SequenceNumber> order(count);
    for (int i = 0; i < count; ++i) {
        order[i] = i;
    }
    std::mt19937 gen(1234);
    std::shuffle(order.begin(), order.end(), gen);

    Channel<ResultChunk<int>> in(8);
    std::thread feeder([&]() {
        for (SequenceNumber id : order) {
            in.produce(result(id));
        }
        in.close();
    });

    std::vector<SequenceNumber> seen;
    std::thread consumer([&]() {
        ResultChunk<int> chunk;
        while (collector.output().consume(chunk)) {
            seen.push_back(chunk.id);
        }
    });

    collector.run(in);
    feeder.join();
    consumer.join();

    ASSERT_EQ(seen.size(), static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        EXPECT_EQ(seen[i], static_cast<SequenceNumber>(i));
    }
    EXPECT_EQ(collector.forwarded(), static_cast<std::size_t>(count));
}
