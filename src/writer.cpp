#include <wirebuf/writer.hpp>

#include <limits>
#include <stdexcept>
#include <utility>

#include <wirebuf/sink.hpp>

namespace wirebuf {

Writer::Writer(Sink& sink, size_t capacity)
    : sink_{sink}
{
    current_.reserve(capacity);
}

template <typename T>
void Writer::pushInteger(T value, ByteOrder order)
{
    uint8_t bytes[sizeof(T)];
    encodeInteger(value, order, bytes);
    current_.insert(std::end(current_), bytes, bytes + sizeof(T));
}

void Writer::push(uint8_t value)
{
    current_.push_back(value);
}

void Writer::pushU16(uint16_t value, ByteOrder order)
{
    this->pushInteger(value, order);
}

void Writer::pushU32(uint32_t value, ByteOrder order)
{
    this->pushInteger(value, order);
}

void Writer::pushU64(uint64_t value, ByteOrder order)
{
    this->pushInteger(value, order);
}

void Writer::write(uint8_t const *data, size_t size)
{
    if (size <= kCoalesceLimit) {
        current_.insert(std::end(current_), data, data + size);
        return;
    }
    this->write(Chunk{Bytes{data, data + size}});
}

void Writer::write(std::string_view bytes)
{
    this->write(reinterpret_cast<uint8_t const *>(bytes.data()), bytes.size());
}

void Writer::write(Bytes bytes)
{
    if (bytes.size() <= kCoalesceLimit) {
        current_.insert(std::end(current_), std::begin(bytes), std::end(bytes));
        return;
    }
    this->write(Chunk{std::move(bytes)});
}

void Writer::write(Chunk chunk)
{
    if (chunk.size() <= kCoalesceLimit) {
        current_.insert(std::end(current_), chunk.data(), chunk.data() + chunk.size());
        return;
    }

    // keep the byte order: whatever was buffered goes first
    if (!current_.empty()) {
        this->handOff();
    }
    sink_.writeBytes(std::move(chunk));
}

void Writer::writeLine(std::string_view line)
{
    this->write(line);
    this->write(std::string_view{"\r\n"});
}

void Writer::writeFrameLengthPrefixed(Chunk payload)
{
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error{"frame payload too large"};
    }
    this->pushU32(static_cast<uint32_t>(payload.size()), ByteOrder::BIG);
    this->write(std::move(payload));
}

void Writer::writeFrameLengthPrefixed(std::string_view payload)
{
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error{"frame payload too large"};
    }
    this->pushU32(static_cast<uint32_t>(payload.size()), ByteOrder::BIG);
    this->write(payload);
}

void Writer::handOff()
{
    auto const capacity = current_.capacity();
    sink_.writeBytes(Chunk{std::move(current_)});

    // same size as last time, volume per flush tends to repeat
    current_ = Bytes{};
    current_.reserve(capacity);
}

void Writer::flush()
{
    if (!current_.empty()) {
        this->handOff();
    }
    sink_.writeFlush();
}

auto operator<<(Writer& writer, uint8_t value) -> Writer&
{
    writer.push(value);
    return writer;
}

auto operator<<(Writer& writer, std::string_view bytes) -> Writer&
{
    writer.write(bytes);
    return writer;
}

auto operator<<(Writer& writer, Bytes bytes) -> Writer&
{
    writer.write(std::move(bytes));
    return writer;
}

auto operator<<(Writer& writer, Chunk chunk) -> Writer&
{
    writer.write(std::move(chunk));
    return writer;
}

auto operator<<(Writer& writer, Writable const& value) -> Writer&
{
    value.writeTo(writer);
    return writer;
}

}  // namespace wirebuf
