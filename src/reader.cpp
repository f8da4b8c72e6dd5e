#include <wirebuf/reader.hpp>

#include <algorithm>
#include <stdexcept>

#include <wirebuf/source.hpp>
#include "utils.hpp"

namespace wirebuf {

Reader::Reader(size_t capacity)
    : storage_{std::make_shared<Bytes>(capacity)}
    , initialCapacity_{capacity > 0 ? capacity : kDefaultCapacity}
{
}

void Reader::clear()
{
    if (this->isShared()) {
        // extracted chunks keep the old bytes alive
        storage_ = std::make_shared<Bytes>(initialCapacity_);
    }
    base_ = end_ = 0;
    marker_ = cursor_ = 0;
    lost_ = 0;
}

void Reader::advance(size_t n)
{
    if (n > this->bytesAhead()) {
        throw OutOfDataError{};
    }
    cursor_ += n;
}

void Reader::skipLiteral(std::string_view literal)
{
    if (literal.size() > this->bytesAhead()) {
        throw OutOfDataError{};
    }

    std::string_view const actual{reinterpret_cast<char const *>(this->begin() + cursor_), literal.size()};
    if (actual != literal) {
        throw InvalidTokenError{"unexpected literal"};
    }
    cursor_ += literal.size();
}

auto Reader::peekByte(size_t n) const -> uint8_t
{
    if (n >= this->bytesAhead()) {
        throw OutOfDataError{};
    }
    return this->begin()[cursor_ + n];
}

template <typename T>
auto Reader::peekInteger(size_t n, ByteOrder order) const -> T
{
    auto const ahead = this->bytesAhead();
    if (n > ahead || ahead - n < sizeof(T)) {
        throw OutOfDataError{};
    }
    return decodeInteger<T>(this->begin() + cursor_ + n, order);
}

auto Reader::peekU16(size_t n, ByteOrder order) const -> uint16_t
{
    return this->peekInteger<uint16_t>(n, order);
}

auto Reader::peekU32(size_t n, ByteOrder order) const -> uint32_t
{
    return this->peekInteger<uint32_t>(n, order);
}

auto Reader::peekU64(size_t n, ByteOrder order) const -> uint64_t
{
    return this->peekInteger<uint64_t>(n, order);
}

auto Reader::takeByte() -> uint8_t
{
    auto const value = this->peekByte(0);
    cursor_ += 1;
    return value;
}

auto Reader::takeU16(ByteOrder order) -> uint16_t
{
    auto const value = this->peekU16(0, order);
    cursor_ += sizeof(value);
    return value;
}

auto Reader::takeU32(ByteOrder order) -> uint32_t
{
    auto const value = this->peekU32(0, order);
    cursor_ += sizeof(value);
    return value;
}

auto Reader::takeU64(ByteOrder order) -> uint64_t
{
    auto const value = this->peekU64(0, order);
    cursor_ += sizeof(value);
    return value;
}

auto Reader::extractRange(size_t first, size_t last, size_t consumed) -> Chunk
{
    Chunk result;
    if (last > first) {
        result = Chunk{storage_, base_ + first, last - first};
    }

    base_ += consumed;
    lost_ += consumed;
    marker_ = cursor_ = 0;

    if (base_ == end_ && !this->isShared()) {
        base_ = end_ = 0;
    }
    return result;
}

auto Reader::extractToken() -> Chunk
{
    return this->extractRange(marker_, cursor_, cursor_);
}

auto Reader::extractAll() -> Chunk
{
    cursor_ = this->size();
    return this->extractToken();
}

auto Reader::extractLine() -> Chunk
{
    auto const *bytes = this->begin();
    auto const *last = bytes + this->size();
    auto const *lf = std::find(bytes + cursor_, last, '\n');
    if (lf == last) {
        throw OutOfDataError{};
    }

    auto const terminator = static_cast<size_t>(lf - bytes);
    auto end = terminator;
    if (end > marker_ && bytes[end - 1] == '\r') {
        end--;
    }
    return this->extractRange(marker_, end, terminator + 1);
}

auto Reader::extractFrameLengthPrefixed() -> Chunk
{
    auto const length = this->peekU32(0, ByteOrder::BIG);
    if (this->bytesAhead() - kFrameHeaderSize < length) {
        throw OutOfDataError{};
    }

    cursor_ += kFrameHeaderSize;
    this->markHere();
    cursor_ += length;
    return this->extractToken();
}

auto Reader::tokenAsString() const -> std::string_view
{
    return {reinterpret_cast<char const *>(this->begin() + marker_), this->tokenByteSize()};
}

auto Reader::tokenAsPositiveInteger() const -> uint64_t
{
    if (this->tokenByteSize() == 0) {
        throw InvalidTokenError{"empty integer token"};
    }

    uint64_t value = 0;
    this->eachTokenByte([&value](uint8_t c) { utils::accumulateDigit(value, c); });
    return value;
}

auto Reader::isTokenEqualTo(std::string_view other) const -> bool
{
    return this->tokenAsString() == other;
}

auto Reader::isTokenAsciiLowercaseEqualTo(std::string_view other) const -> bool
{
    auto const token = this->tokenAsString();
    if (token.size() != other.size()) {
        return false;
    }
    return std::equal(std::begin(token), std::end(token), std::begin(other),
                      [](char a, char b) {
                          return utils::asciiToLower(static_cast<uint8_t>(a)) == static_cast<uint8_t>(b);
                      });
}

void Reader::ensureWritable(size_t n)
{
    auto const capacity = storage_->size();
    if (capacity - end_ >= n) {
        return;
    }

    auto const live = this->size();

    // enough room once the discarded front is reclaimed
    if (!this->isShared() && capacity - live >= n) {
        std::copy(storage_->begin() + base_, storage_->begin() + end_, storage_->begin());
        base_ = 0;
        end_ = live;
        return;
    }

    auto target = std::max(live + n, capacity * 2);
    target = (target + initialCapacity_ - 1) / initialCapacity_ * initialCapacity_;

    if (this->isShared()) {
        // chunks still point into the old storage, never touch it again
        auto fresh = std::make_shared<Bytes>(target);
        std::copy(storage_->begin() + base_, storage_->begin() + end_, fresh->begin());
        storage_ = std::move(fresh);
    } else {
        std::copy(storage_->begin() + base_, storage_->begin() + end_, storage_->begin());
        storage_->resize(target);
    }
    base_ = 0;
    end_ = live;
}

void Reader::reserveBytesAhead(size_t n)
{
    auto const ahead = this->bytesAhead();
    if (ahead < n) {
        this->ensureWritable(n - ahead);
    }
}

void Reader::reserveAdditional(size_t n)
{
    this->ensureWritable(n);
}

void Reader::append(uint8_t const *data, size_t size)
{
    if (size == 0) {
        return;
    }
    this->ensureWritable(size);
    std::copy(data, data + size, storage_->begin() + end_);
    end_ += size;
}

void Reader::append(Chunk const& chunk)
{
    this->append(chunk.data(), chunk.size());
}

void Reader::append(std::string_view bytes)
{
    this->append(reinterpret_cast<uint8_t const *>(bytes.data()), bytes.size());
}

auto Reader::writableRegion() -> WritableRegion
{
    if (storage_->size() == end_) {
        this->ensureWritable(initialCapacity_);
    }
    return {storage_->data() + end_, storage_->size() - end_};
}

void Reader::commitWritten(size_t n)
{
    if (n > storage_->size() - end_) {
        throw std::out_of_range{"committed more than the writable region"};
    }
    end_ += n;
}

auto FillableReader::fillFrom(Source& source) -> size_t
{
    auto const region = this->writableRegion();
    auto const n = source.emit(region.data, region.size);
    this->commitWritten(n);
    return n;
}

}  // namespace wirebuf
