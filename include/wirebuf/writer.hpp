#ifndef WIREBUF_WRITER_HPP_
#define WIREBUF_WRITER_HPP_

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <wirebuf/bytes.hpp>
#include <wirebuf/chunk.hpp>

namespace wirebuf {

class Sink;

// Batches writes into chunks for a Sink.
//
// Small writes are copied into the chunk being filled. Larger ones go to the
// sink as they are, right after whatever was buffered before them.
class Writer {
public:
    // writes up to this size are coalesced
    static constexpr size_t kCoalesceLimit = 64;
    static constexpr size_t kDefaultCapacity = 1024;

    // not owning
    explicit Writer(Sink& sink, size_t capacity = kDefaultCapacity);

    Writer(Writer const&) = delete;
    Writer& operator=(Writer const&) = delete;

    void push(uint8_t value);
    void pushU16(uint16_t value, ByteOrder order = ByteOrder::NATIVE);
    void pushU32(uint32_t value, ByteOrder order = ByteOrder::NATIVE);
    void pushU64(uint64_t value, ByteOrder order = ByteOrder::NATIVE);

    void write(uint8_t const *data, size_t size);
    void write(std::string_view bytes);
    void write(Bytes bytes);
    void write(Chunk chunk);

    // content followed by CRLF
    void writeLine(std::string_view line);
    // 4-byte big-endian length followed by the payload
    void writeFrameLengthPrefixed(Chunk payload);
    void writeFrameLengthPrefixed(std::string_view payload);

    // throws IncompleteFlushError, retry later
    void flush();

    auto bufferedSize() const -> size_t { return current_.size(); }
    auto capacity() const -> size_t { return current_.capacity(); }

private:
    Sink& sink_;
    Bytes current_;

    void handOff();

    template <typename T>
    void pushInteger(T value, ByteOrder order);
};

class Writable {
public:
    virtual ~Writable() = default;

    virtual void writeTo(Writer& writer) const = 0;
};

auto operator<<(Writer& writer, uint8_t value) -> Writer&;
auto operator<<(Writer& writer, std::string_view bytes) -> Writer&;
auto operator<<(Writer& writer, Bytes bytes) -> Writer&;
auto operator<<(Writer& writer, Chunk chunk) -> Writer&;
auto operator<<(Writer& writer, Writable const& value) -> Writer&;

}  // namespace wirebuf

#endif  // WIREBUF_WRITER_HPP_
