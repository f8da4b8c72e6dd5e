#ifndef WIREBUF_MAILBOX_HPP_
#define WIREBUF_MAILBOX_HPP_

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include <wirebuf/chunk.hpp>
#include <wirebuf/sink.hpp>

namespace wirebuf {

class ChunkedReader;

// Thread-safe hand-off point between an ActorSink and the thread that
// parses. Batches are moved in by the sender and moved out by the receiver.
class ChunkMailbox : public ChunkReceiver {
public:
    void writeChunks(std::vector<Chunk> chunks) override;

    // appends every queued chunk in arrival order, returns bytes moved
    auto drainInto(ChunkedReader& reader) -> size_t;

    auto pendingBatches() const -> size_t;

private:
    mutable std::mutex mutex_;
    std::deque<std::vector<Chunk>> batches_;
};

}  // namespace wirebuf

#endif  // WIREBUF_MAILBOX_HPP_
