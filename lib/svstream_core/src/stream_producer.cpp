#include "sv/stream/stream_producer.hpp"

#include "sv/stream/display_width.hpp"

#include <utility>

namespace sv::stream
{

StreamProducer::StreamProducer(StreamRenderer renderer)
    : renderer_(std::move(renderer))
{
}

StreamProducer::~StreamProducer()
{
    cancel();
}

void StreamProducer::start(std::string text)
{
    start(std::move(text), Settings{});
}

void StreamProducer::start(std::string text, Settings settings)
{
    cancel();
    finishedPending_.store(false, std::memory_order_release);
    chunksSent_.store(0, std::memory_order_release);

    auto task = std::make_unique<Task>();
    Task *rawTask = task.get();
    log("[STREAM] start, " + std::to_string(text.size()) + " bytes");
    rawTask->worker = std::thread([this, rawTask, text = std::move(text), settings]() mutable {
        run(*rawTask, std::move(text), settings);
    });
    active_ = std::move(task);
}

void StreamProducer::cancel()
{
    if (!active_)
        return;

    bool wasRunning = !active_->finished.load(std::memory_order_acquire);
    active_->cancel.store(true, std::memory_order_release);
    if (active_->worker.joinable())
        active_->worker.join();
    active_.reset();
    if (wasRunning)
        log("[STREAM] cancelled after " + std::to_string(chunksSent()) + " chunks");
}

bool StreamProducer::running() const
{
    return active_ && !active_->finished.load(std::memory_order_acquire);
}

bool StreamProducer::consumeFinished()
{
    return finishedPending_.exchange(false, std::memory_order_acq_rel);
}

std::size_t StreamProducer::chunksSent() const noexcept
{
    return chunksSent_.load(std::memory_order_acquire);
}

void StreamProducer::setLogSink(LogSink sink)
{
    logSink_ = std::move(sink);
}

std::vector<std::string> StreamProducer::splitIntoChunks(std::string_view text,
                                                         std::size_t maxChunkBytes)
{
    std::vector<std::string> chunks;
    if (maxChunkBytes == 0)
        maxChunkBytes = 1;

    std::string current;
    auto flush = [&]() {
        if (!current.empty())
            chunks.push_back(std::move(current));
        current.clear();
    };

    std::size_t index = 0;
    while (index < text.size())
    {
        std::size_t start = index;
        std::uint32_t cp = decodeCodepoint(text, index);
        // Never split a code point, even if that overshoots the bound.
        if (current.size() + (index - start) > maxChunkBytes)
            flush();
        current.append(text.substr(start, index - start));
        if (cp == ' ' || cp == '\n' || cp == '\t')
            flush();
    }
    flush();
    return chunks;
}

void StreamProducer::run(Task &task, std::string text, Settings settings)
{
    for (const auto &chunk : splitIntoChunks(text, settings.maxChunkBytes))
    {
        if (task.cancel.load(std::memory_order_acquire))
            break;

        renderer_.append(chunk);
        chunksSent_.fetch_add(1, std::memory_order_acq_rel);
        if (settings.chunkDelay.count() > 0)
            std::this_thread::sleep_for(settings.chunkDelay);
    }

    task.finished.store(true, std::memory_order_release);
    finishedPending_.store(true, std::memory_order_release);
}

void StreamProducer::log(const std::string &entry) const
{
    if (logSink_)
        logSink_(entry);
}

} // namespace sv::stream
