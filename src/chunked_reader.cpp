#include <wirebuf/chunked_reader.hpp>

#include <algorithm>
#include <utility>

#include "utils.hpp"

namespace wirebuf {

void ChunkedReader::append(Chunk chunk)
{
    if (chunk.empty()) {
        return;
    }
    aheadOfMarker_ += chunk.size();
    aheadOfCursor_ += chunk.size();
    // a position at the end now points at the new chunk
    chunks_.push_back(std::move(chunk));
}

void ChunkedReader::clear()
{
    chunks_.clear();
    marker_ = cursor_ = Position{};
    aheadOfMarker_ = aheadOfCursor_ = 0;
}

void ChunkedReader::compact()
{
    auto const dead = std::min(marker_.chunk, cursor_.chunk);
    if (dead == 0) {
        return;
    }
    chunks_.erase(std::begin(chunks_), std::begin(chunks_) + dead);
    marker_.chunk -= dead;
    cursor_.chunk -= dead;
}

void ChunkedReader::markHere()
{
    marker_ = cursor_;
    aheadOfMarker_ = aheadOfCursor_;
}

void ChunkedReader::rewindToMarker()
{
    cursor_ = marker_;
    aheadOfCursor_ = aheadOfMarker_;
}

auto ChunkedReader::walk(Position pos, size_t n) const -> Position
{
    while (n > 0) {
        auto const remaining = chunks_[pos.chunk].size() - pos.offset;
        if (n < remaining) {
            pos.offset += n;
            return pos;
        }
        n -= remaining;
        pos.chunk++;
        pos.offset = 0;
    }
    return pos;
}

void ChunkedReader::stepCursor()
{
    cursor_.offset++;
    if (cursor_.offset == chunks_[cursor_.chunk].size()) {
        cursor_.chunk++;
        cursor_.offset = 0;
    }
    aheadOfCursor_--;
}

void ChunkedReader::advance(size_t n)
{
    if (n > aheadOfCursor_) {
        throw OutOfDataError{};
    }
    cursor_ = this->walk(cursor_, n);
    aheadOfCursor_ -= n;
}

void ChunkedReader::skipLiteral(std::string_view literal)
{
    if (literal.size() > aheadOfCursor_) {
        throw OutOfDataError{};
    }

    auto pos = cursor_;
    for (char const expected : literal) {
        if (chunks_[pos.chunk][pos.offset] != static_cast<uint8_t>(expected)) {
            throw InvalidTokenError{"unexpected literal"};
        }
        pos = this->walk(pos, 1);
    }
    cursor_ = pos;
    aheadOfCursor_ -= literal.size();
}

auto ChunkedReader::peekByte(size_t n) const -> uint8_t
{
    if (n >= aheadOfCursor_) {
        throw OutOfDataError{};
    }
    auto const pos = this->walk(cursor_, n);
    return chunks_[pos.chunk][pos.offset];
}

template <typename T>
auto ChunkedReader::peekInteger(size_t n, ByteOrder order) const -> T
{
    if (n > aheadOfCursor_ || aheadOfCursor_ - n < sizeof(T)) {
        throw OutOfDataError{};
    }

    // no contiguous memory to read from, gather byte by byte
    uint8_t bytes[sizeof(T)];
    auto pos = this->walk(cursor_, n);
    for (size_t i = 0; i < sizeof(T); i++) {
        bytes[i] = chunks_[pos.chunk][pos.offset];
        pos = this->walk(pos, 1);
    }
    return decodeInteger<T>(bytes, order);
}

auto ChunkedReader::peekU16(size_t n, ByteOrder order) const -> uint16_t
{
    return this->peekInteger<uint16_t>(n, order);
}

auto ChunkedReader::peekU32(size_t n, ByteOrder order) const -> uint32_t
{
    return this->peekInteger<uint32_t>(n, order);
}

auto ChunkedReader::peekU64(size_t n, ByteOrder order) const -> uint64_t
{
    return this->peekInteger<uint64_t>(n, order);
}

auto ChunkedReader::takeByte() -> uint8_t
{
    auto const value = this->peekByte(0);
    this->stepCursor();
    return value;
}

auto ChunkedReader::takeU16(ByteOrder order) -> uint16_t
{
    auto const value = this->peekU16(0, order);
    this->advance(sizeof(value));
    return value;
}

auto ChunkedReader::takeU32(ByteOrder order) -> uint32_t
{
    auto const value = this->peekU32(0, order);
    this->advance(sizeof(value));
    return value;
}

auto ChunkedReader::takeU64(ByteOrder order) -> uint64_t
{
    auto const value = this->peekU64(0, order);
    this->advance(sizeof(value));
    return value;
}

auto ChunkedReader::collect(Position from, size_t size) const -> Chunk
{
    if (size == 0) {
        return Chunk{};
    }

    auto const& first = chunks_[from.chunk];
    if (first.size() - from.offset >= size) {
        return first.slice(from.offset, size);
    }

    Bytes bytes;
    bytes.reserve(size);
    while (size > 0) {
        auto const& chunk = chunks_[from.chunk];
        auto const n = std::min(size, chunk.size() - from.offset);
        bytes.insert(std::end(bytes), chunk.data() + from.offset, chunk.data() + from.offset + n);
        size -= n;
        from.chunk++;
        from.offset = 0;
    }
    return Chunk{std::move(bytes)};
}

auto ChunkedReader::tokenAsString() const -> Chunk
{
    return this->collect(marker_, this->tokenByteSize());
}

auto ChunkedReader::extractToken() -> Chunk
{
    auto token = this->tokenAsString();
    this->markHere();
    this->compact();
    return token;
}

auto ChunkedReader::extractAll() -> Chunk
{
    this->advance(aheadOfCursor_);
    return this->extractToken();
}

auto ChunkedReader::extractLine() -> Chunk
{
    size_t distance = 0;
    auto pos = cursor_;
    while (true) {
        if (pos.chunk == chunks_.size()) {
            throw OutOfDataError{};
        }
        auto const view = chunks_[pos.chunk].view().substr(pos.offset);
        auto const n = view.find('\n');
        if (n != std::string_view::npos) {
            distance += n;
            break;
        }
        distance += view.size();
        pos.chunk++;
        pos.offset = 0;
    }

    this->advance(distance);
    auto line = this->tokenAsString();
    if (!line.empty() && line[line.size() - 1] == '\r') {
        line = line.slice(0, line.size() - 1);
    }

    // step over the line feed
    this->stepCursor();
    this->markHere();
    this->compact();
    return line;
}

auto ChunkedReader::extractFrameLengthPrefixed() -> Chunk
{
    auto const length = this->peekU32(0, ByteOrder::BIG);
    if (aheadOfCursor_ - sizeof(uint32_t) < length) {
        throw OutOfDataError{};
    }

    this->advance(sizeof(uint32_t));
    this->markHere();
    this->advance(length);
    return this->extractToken();
}

auto ChunkedReader::tokenAsPositiveInteger() const -> uint64_t
{
    if (this->tokenByteSize() == 0) {
        throw InvalidTokenError{"empty integer token"};
    }

    uint64_t value = 0;
    this->eachTokenByte([&value](uint8_t c) { utils::accumulateDigit(value, c); });
    return value;
}

auto ChunkedReader::isTokenEqualTo(std::string_view other) const -> bool
{
    if (this->tokenByteSize() != other.size()) {
        return false;
    }

    bool equal = true;
    this->eachTokenSlice([&](std::string_view slice) {
        equal = equal && slice == other.substr(0, slice.size());
        other.remove_prefix(slice.size());
    });
    return equal;
}

auto ChunkedReader::isTokenAsciiLowercaseEqualTo(std::string_view other) const -> bool
{
    if (this->tokenByteSize() != other.size()) {
        return false;
    }

    size_t i = 0;
    bool equal = true;
    this->eachTokenByte([&](uint8_t c) {
        equal = equal && utils::asciiToLower(c) == static_cast<uint8_t>(other[i]);
        i++;
    });
    return equal;
}

}  // namespace wirebuf
