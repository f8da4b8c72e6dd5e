#include <wirebuf/sink.hpp>

#include <utility>

#include <spdlog/spdlog.h>

#include <wirebuf/exceptions.hpp>
#include <wirebuf/reader.hpp>

namespace wirebuf {

namespace {

auto totalSize(std::vector<Chunk> const& chunks) -> size_t
{
    size_t total = 0;
    for (auto const& chunk : chunks) {
        total += chunk.size();
    }
    return total;
}

}  // namespace

ReaderSink::ReaderSink(FillableReader& reader)
    : reader_{reader}
{
}

void ReaderSink::writeBytes(Chunk chunk)
{
    if (!chunk.empty()) {
        pending_.push_back(std::move(chunk));
    }
}

void ReaderSink::writeFlush()
{
    reader_.reserveAdditional(totalSize(pending_));
    for (auto const& chunk : pending_) {
        reader_.append(chunk);
    }
    pending_.clear();
}

auto ReaderSink::pendingSize() const -> size_t
{
    return totalSize(pending_);
}

ActorSink::ActorSink(ChunkReceiver& receiver)
    : receiver_{receiver}
{
}

void ActorSink::writeBytes(Chunk chunk)
{
    if (!chunk.empty()) {
        pending_.push_back(std::move(chunk));
    }
}

void ActorSink::writeFlush()
{
    if (pending_.empty()) {
        return;
    }

    std::vector<Chunk> batch;
    batch.swap(pending_);
    receiver_.writeChunks(std::move(batch));
}

void PushSink::writeBytes(Chunk chunk)
{
    if (!chunk.empty()) {
        pending_.push_back(std::move(chunk));
    }
}

void PushSink::writeFlush()
{
    while (!pending_.empty()) {
        auto& chunk = pending_.front();
        auto const n = this->push(chunk.data(), chunk.size());
        if (n == 0) {
            break;
        }
        if (n < chunk.size()) {
            chunk = chunk.slice(n, chunk.size() - n);
            continue;
        }
        pending_.pop_front();
    }

    if (!pending_.empty()) {
        spdlog::debug("Flush stalled with {} bytes pending", this->pendingSize());
        throw IncompleteFlushError{};
    }
    this->pushed();
}

auto PushSink::pendingSize() const -> size_t
{
    size_t total = 0;
    for (auto const& chunk : pending_) {
        total += chunk.size();
    }
    return total;
}

}  // namespace wirebuf
