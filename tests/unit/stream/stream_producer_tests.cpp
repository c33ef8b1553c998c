#include <gtest/gtest.h>

#include "sv/stream/display_surface.hpp"
#include "sv/stream/stream_producer.hpp"
#include "sv/stream/stream_renderer.hpp"

#include <chrono>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using sv::stream::StreamProducer;

namespace
{

std::string joined(const std::vector<std::string> &chunks)
{
    return std::accumulate(chunks.begin(), chunks.end(), std::string());
}

bool waitForFinish(StreamProducer &producer, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (producer.consumeFinished())
            return true;
        std::this_thread::sleep_for(1ms);
    }
    return false;
}

} // namespace

TEST(StreamProducer, SplitsAfterWhitespace)
{
    auto chunks = StreamProducer::splitIntoChunks("one two\nthree", 12);
    EXPECT_EQ(chunks, (std::vector<std::string>{"one ", "two\n", "three"}));
}

TEST(StreamProducer, SplitsLongWordsAtSizeBound)
{
    auto chunks = StreamProducer::splitIntoChunks("abcdefghij", 4);
    EXPECT_EQ(chunks, (std::vector<std::string>{"abcd", "efgh", "ij"}));
}

TEST(StreamProducer, NeverSplitsCodePoints)
{
    // Four three-byte ideographs with a bound that is not a multiple of three.
    const std::string text = "\xe4\xb8\x80\xe4\xba\x8c\xe4\xb8\x89\xe5\x9b\x9b";
    auto chunks = StreamProducer::splitIntoChunks(text, 4);
    ASSERT_EQ(chunks.size(), 4u);
    for (const auto &chunk : chunks)
        EXPECT_EQ(chunk.size(), 3u);
    EXPECT_EQ(joined(chunks), text);
}

TEST(StreamProducer, EmptyTextHasNoChunks)
{
    EXPECT_TRUE(StreamProducer::splitIntoChunks("", 8).empty());
    EXPECT_EQ(StreamProducer::splitIntoChunks("ab", 0), (std::vector<std::string>{"a", "b"}));
}

TEST(StreamProducer, StreamsWholeTextIntoRenderer)
{
    sv::stream::StreamRenderer renderer;
    sv::stream::BufferSurface surface(80, 10);
    renderer.attachSurface(&surface);
    renderer.setSize(80, 10);

    const std::string text = "Streaming text arrives in small pieces, one token at a time.\n";
    StreamProducer producer(renderer);
    producer.start(text, StreamProducer::Settings{8, 0ms});
    ASSERT_TRUE(waitForFinish(producer, 5000ms));
    EXPECT_FALSE(producer.running());
    EXPECT_FALSE(producer.consumeFinished());

    renderer.forceUpdate();
    EXPECT_EQ(renderer.content(), text);
    EXPECT_EQ(producer.chunksSent(), StreamProducer::splitIntoChunks(text, 8).size());
    ASSERT_FALSE(surface.rows().empty());
    EXPECT_EQ(surface.rows().front(), "Streaming text arrives in small pieces, one token at a time.");
}

TEST(StreamProducer, CancelStopsStream)
{
    sv::stream::StreamRenderer renderer;
    const std::string text(2000, 'x');
    StreamProducer producer(renderer);

    std::vector<std::string> log;
    producer.setLogSink([&log](const std::string &entry)
                        { log.push_back(entry); });
    producer.start(text, StreamProducer::Settings{1, 5ms});
    std::this_thread::sleep_for(20ms);
    producer.cancel();

    EXPECT_FALSE(producer.running());
    EXPECT_LT(renderer.contentSize(), text.size());
    EXPECT_EQ(renderer.contentSize(), producer.chunksSent());
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log.front().rfind("[STREAM] start", 0), 0u);
    EXPECT_EQ(log.back().rfind("[STREAM] cancelled", 0), 0u);
}
