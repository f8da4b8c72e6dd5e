#ifndef WIREBUF_CHUNKED_READER_HPP_
#define WIREBUF_CHUNKED_READER_HPP_

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include <wirebuf/bytes.hpp>
#include <wirebuf/chunk.hpp>
#include <wirebuf/exceptions.hpp>

namespace wirebuf {

// Same token vocabulary as Reader, over a list of chunks that are never
// copied on arrival. Reads spanning several chunks are supported everywhere.
class ChunkedReader {
public:
    ChunkedReader() = default;

    // empty chunks are ignored
    void append(Chunk chunk);
    void clear();
    // drops leading chunks that lie entirely behind both marker and cursor
    void compact();

    auto chunkCount() const -> size_t { return chunks_.size(); }

    auto bytesAhead() const -> size_t { return aheadOfCursor_; }
    auto tokenByteSize() const -> size_t { return aheadOfMarker_ - aheadOfCursor_; }

    void markHere();
    void rewindToMarker();

    void advance(size_t n);

    template <typename Predicate>
    void advanceWhile(Predicate predicate);

    // throws InvalidTokenError on mismatch
    void skipLiteral(std::string_view literal);

    auto peekByte(size_t n = 0) const -> uint8_t;
    auto peekU16(size_t n = 0, ByteOrder order = ByteOrder::NATIVE) const -> uint16_t;
    auto peekU32(size_t n = 0, ByteOrder order = ByteOrder::NATIVE) const -> uint32_t;
    auto peekU64(size_t n = 0, ByteOrder order = ByteOrder::NATIVE) const -> uint64_t;

    auto takeByte() -> uint8_t;
    auto takeU16(ByteOrder order = ByteOrder::NATIVE) -> uint16_t;
    auto takeU32(ByteOrder order = ByteOrder::NATIVE) -> uint32_t;
    auto takeU64(ByteOrder order = ByteOrder::NATIVE) -> uint64_t;

    // After extraction the marker is moved to the cursor and
    // fully consumed chunks are dropped.
    auto extractToken() -> Chunk;
    auto extractAll() -> Chunk;
    auto extractLine() -> Chunk;
    auto extractFrameLengthPrefixed() -> Chunk;

    // no copy when the token lies within a single chunk
    auto tokenAsString() const -> Chunk;
    auto tokenAsPositiveInteger() const -> uint64_t;
    auto isTokenEqualTo(std::string_view other) const -> bool;
    auto isTokenAsciiLowercaseEqualTo(std::string_view other) const -> bool;

    template <typename Function>
    void eachTokenSlice(Function function) const;

    template <typename Function>
    void eachTokenByte(Function function) const;

private:
    // chunk == chunks_.size() means nothing ahead
    struct Position {
        size_t chunk{0};
        size_t offset{0};
    };

    std::vector<Chunk> chunks_;
    Position marker_;
    Position cursor_;
    size_t aheadOfMarker_{0};
    size_t aheadOfCursor_{0};

    // n must not exceed the bytes ahead of pos
    auto walk(Position pos, size_t n) const -> Position;
    auto collect(Position from, size_t size) const -> Chunk;
    void stepCursor();

    template <typename T>
    auto peekInteger(size_t n, ByteOrder order) const -> T;
};

template <typename Predicate>
void ChunkedReader::advanceWhile(Predicate predicate)
{
    while (cursor_.chunk < chunks_.size()) {
        if (!predicate(chunks_[cursor_.chunk][cursor_.offset])) {
            return;
        }
        this->stepCursor();
    }
    throw OutOfDataError{};
}

template <typename Function>
void ChunkedReader::eachTokenSlice(Function function) const
{
    auto pos = marker_;
    while (pos.chunk < cursor_.chunk) {
        function(chunks_[pos.chunk].view().substr(pos.offset));
        pos.chunk++;
        pos.offset = 0;
    }
    if (cursor_.offset > pos.offset) {
        function(chunks_[pos.chunk].view().substr(pos.offset, cursor_.offset - pos.offset));
    }
}

template <typename Function>
void ChunkedReader::eachTokenByte(Function function) const
{
    this->eachTokenSlice([&function](std::string_view slice) {
        for (char const c : slice) {
            function(static_cast<uint8_t>(c));
        }
    });
}

}  // namespace wirebuf

#endif  // WIREBUF_CHUNKED_READER_HPP_
