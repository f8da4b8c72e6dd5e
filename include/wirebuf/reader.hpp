#ifndef WIREBUF_READER_HPP_
#define WIREBUF_READER_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include <wirebuf/bytes.hpp>
#include <wirebuf/chunk.hpp>
#include <wirebuf/exceptions.hpp>

namespace wirebuf {

class Source;

// Cursor and marker over one contiguous growable buffer.
//
// The token is the byte range [marker, cursor). Operations that fail with
// OutOfDataError leave the reader untouched (advanceWhile keeps the bytes it
// already matched), so callers can markHere() before parsing and
// rewindToMarker() to retry once more bytes arrived.
//
// This class only reads. Growing and filling the buffer is done through
// FillableReader, which is held by whoever feeds the stream.
class Reader {
public:
    static constexpr size_t kDefaultCapacity = 4096;
    static constexpr size_t kFrameHeaderSize = 4;

    explicit Reader(size_t capacity = kDefaultCapacity);
    virtual ~Reader() = default;

    Reader(Reader const&) = delete;
    Reader& operator=(Reader const&) = delete;

    auto size() const -> size_t { return end_ - base_; }
    auto empty() const -> bool { return this->size() == 0; }

    auto cursor() const -> size_t { return cursor_; }
    auto marker() const -> size_t { return marker_; }

    auto bytesAhead() const -> size_t { return this->size() - cursor_; }
    // absolute stream position of the cursor
    auto bytesBehind() const -> uint64_t { return lost_ + cursor_; }
    auto tokenByteSize() const -> size_t { return cursor_ - marker_; }

    void markHere() { marker_ = cursor_; }
    void rewindToMarker() { cursor_ = marker_; }

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

    // The returned chunk shares storage with the reader.
    // Everything up to the cursor is discarded, marker and cursor become 0.
    auto extractToken() -> Chunk;
    auto extractAll() -> Chunk;
    // LF or CRLF terminated, the terminator is not part of the result
    auto extractLine() -> Chunk;
    // 4-byte big-endian length followed by the payload
    auto extractFrameLengthPrefixed() -> Chunk;

    // valid until the reader is modified
    auto tokenAsString() const -> std::string_view;
    // decimal digits only, throws InvalidTokenError otherwise
    auto tokenAsPositiveInteger() const -> uint64_t;
    auto isTokenEqualTo(std::string_view other) const -> bool;
    // other must already be lower case
    auto isTokenAsciiLowercaseEqualTo(std::string_view other) const -> bool;

    template <typename Function>
    void eachTokenByte(Function function) const;

protected:
    // drops all bytes, ready for an unrelated stream
    void clear();

    struct WritableRegion {
        uint8_t *data;
        size_t size;
    };

    void reserveBytesAhead(size_t n);
    void reserveAdditional(size_t n);

    void append(uint8_t const *data, size_t size);
    void append(Chunk const& chunk);
    void append(std::string_view bytes);

    // never empty, grows the buffer if necessary
    auto writableRegion() -> WritableRegion;
    void commitWritten(size_t n);

private:
    // storage_->size() is the capacity, [base_, end_) holds the stream
    std::shared_ptr<Bytes> storage_;
    size_t base_{0};
    size_t end_{0};

    size_t marker_{0};
    size_t cursor_{0};
    uint64_t lost_{0};

    size_t const initialCapacity_;

    auto begin() const -> uint8_t const * { return storage_->data() + base_; }

    auto isShared() const -> bool { return storage_.use_count() > 1; }

    void ensureWritable(size_t n);
    auto extractRange(size_t first, size_t last, size_t consumed) -> Chunk;

    template <typename T>
    auto peekInteger(size_t n, ByteOrder order) const -> T;
};

// The privileged view of a Reader, for the component that fills the stream.
// Growing may move the storage, so code that merely parses gets a Reader&
// and can never invalidate a region handed out by writableRegion().
class FillableReader : public Reader {
public:
    using Reader::Reader;

    using Reader::WritableRegion;

    using Reader::clear;
    using Reader::reserveBytesAhead;
    using Reader::reserveAdditional;
    using Reader::append;
    using Reader::writableRegion;
    using Reader::commitWritten;

    // reads once from source into free space, returns bytes received
    // throws SourceClosedError
    auto fillFrom(Source& source) -> size_t;
};

template <typename Predicate>
void Reader::advanceWhile(Predicate predicate)
{
    auto const *bytes = this->begin();
    auto const size = this->size();

    while (cursor_ < size) {
        if (!predicate(bytes[cursor_])) {
            return;
        }
        cursor_++;
    }
    throw OutOfDataError{};
}

template <typename Function>
void Reader::eachTokenByte(Function function) const
{
    auto const *bytes = this->begin();
    for (size_t i = marker_; i < cursor_; i++) {
        function(bytes[i]);
    }
}

}  // namespace wirebuf

#endif  // WIREBUF_READER_HPP_
