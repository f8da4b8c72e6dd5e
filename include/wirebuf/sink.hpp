#ifndef WIREBUF_SINK_HPP_
#define WIREBUF_SINK_HPP_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

#include <wirebuf/chunk.hpp>

namespace wirebuf {

class FillableReader;

class Sink {
public:
    virtual ~Sink() = default;

    // accepts a chunk, nothing is delivered before writeFlush()
    virtual void writeBytes(Chunk chunk) = 0;

    // Delivers everything buffered so far.
    // throws IncompleteFlushError if bytes remain, they are kept for the next call
    virtual void writeFlush() = 0;
};

// Loopback into a reader, for tests and in-process plumbing.
class ReaderSink : public Sink {
public:
    // not owning
    explicit ReaderSink(FillableReader& reader);

    void writeBytes(Chunk chunk) override;
    void writeFlush() override;

    auto pendingSize() const -> size_t;

private:
    FillableReader& reader_;
    std::vector<Chunk> pending_;
};

// The other side of an ActorSink, usually living in another thread.
class ChunkReceiver {
public:
    virtual ~ChunkReceiver() = default;

    // the batch is handed over, the caller keeps nothing
    virtual void writeChunks(std::vector<Chunk> chunks) = 0;
};

class ActorSink : public Sink {
public:
    // not owning
    explicit ActorSink(ChunkReceiver& receiver);

    void writeBytes(Chunk chunk) override;
    void writeFlush() override;

private:
    ChunkReceiver& receiver_;
    std::vector<Chunk> pending_;
};

// Base for sinks backed by a stream that may accept only part of the data.
class PushSink : public Sink {
public:
    void writeBytes(Chunk chunk) override;
    void writeFlush() override;

    auto pendingSize() const -> size_t;

protected:
    // returns bytes accepted, 0 when the stream can't take more right now
    // throws on error
    virtual auto push(uint8_t const *data, size_t size) -> size_t = 0;

    // called once everything has been pushed
    virtual void pushed() {}

private:
    std::deque<Chunk> pending_;
};

}  // namespace wirebuf

#endif  // WIREBUF_SINK_HPP_
