#pragma once

#include "sv/stream/stream_renderer.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace sv::stream
{

// Feeds a renderer from a background thread, one token-sized chunk at a time.
// The render thread polls consumeFinished() and performs the final flush.
class StreamProducer
{
public:
    using LogSink = std::function<void(const std::string &)>;

    struct Settings
    {
        // Upper bound for a chunk; chunks also end after whitespace.
        std::size_t maxChunkBytes = 12;
        std::chrono::milliseconds chunkDelay{15};
    };

    explicit StreamProducer(StreamRenderer renderer);
    ~StreamProducer();

    StreamProducer(const StreamProducer &) = delete;
    StreamProducer &operator=(const StreamProducer &) = delete;

    void start(std::string text);
    void start(std::string text, Settings settings);
    void cancel();

    bool running() const;
    // True exactly once after a stream ran to completion or was cancelled.
    bool consumeFinished();
    std::size_t chunksSent() const noexcept;

    void setLogSink(LogSink sink);

    static std::vector<std::string> splitIntoChunks(std::string_view text, std::size_t maxChunkBytes);

private:
    struct Task
    {
        std::thread worker;
        std::atomic<bool> cancel{false};
        std::atomic<bool> finished{false};
    };

    void run(Task &task, std::string text, Settings settings);
    void log(const std::string &entry) const;

    StreamRenderer renderer_;
    std::unique_ptr<Task> active_;
    std::atomic<bool> finishedPending_{false};
    std::atomic<std::size_t> chunksSent_{0};
    LogSink logSink_;
};

} // namespace sv::stream
