#include <wirebuf/mailbox.hpp>

#include <utility>

#include <wirebuf/chunked_reader.hpp>

namespace wirebuf {

void ChunkMailbox::writeChunks(std::vector<Chunk> chunks)
{
    if (chunks.empty()) {
        return;
    }
    std::scoped_lock lock{mutex_};
    batches_.push_back(std::move(chunks));
}

auto ChunkMailbox::drainInto(ChunkedReader& reader) -> size_t
{
    std::deque<std::vector<Chunk>> batches;
    {
        std::scoped_lock lock{mutex_};
        batches.swap(batches_);
    }

    size_t total = 0;
    for (auto& batch : batches) {
        for (auto& chunk : batch) {
            total += chunk.size();
            reader.append(std::move(chunk));
        }
    }
    return total;
}

auto ChunkMailbox::pendingBatches() const -> size_t
{
    std::scoped_lock lock{mutex_};
    return batches_.size();
}

}  // namespace wirebuf
