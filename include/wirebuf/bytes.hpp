#ifndef WIREBUF_BYTES_HPP_
#define WIREBUF_BYTES_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <vector>

namespace wirebuf {

using Bytes = std::vector<uint8_t>;

enum class ByteOrder {
    NATIVE,
    BIG,
    LITTLE,
};

template <typename T>
auto decodeInteger(uint8_t const *bytes, ByteOrder order) -> T
{
    static_assert(std::is_unsigned_v<T>, "only unsigned integers are supported");

    T value = 0;
    switch (order) {
    case ByteOrder::NATIVE:
        std::memcpy(&value, bytes, sizeof(T));
        break;

    case ByteOrder::BIG:
        for (size_t i = 0; i < sizeof(T); i++) {
            value = static_cast<T>((value << 8) | bytes[i]);
        }
        break;

    case ByteOrder::LITTLE:
        for (size_t i = sizeof(T); i > 0; i--) {
            value = static_cast<T>((value << 8) | bytes[i - 1]);
        }
        break;
    }
    return value;
}

template <typename T>
void encodeInteger(T value, ByteOrder order, uint8_t *bytes)
{
    static_assert(std::is_unsigned_v<T>, "only unsigned integers are supported");

    switch (order) {
    case ByteOrder::NATIVE:
        std::memcpy(bytes, &value, sizeof(T));
        break;

    case ByteOrder::BIG:
        for (size_t i = sizeof(T); i > 0; i--) {
            bytes[i - 1] = static_cast<uint8_t>(value & 0xFF);
            value = static_cast<T>(value >> 8);
        }
        break;

    case ByteOrder::LITTLE:
        for (size_t i = 0; i < sizeof(T); i++) {
            bytes[i] = static_cast<uint8_t>(value & 0xFF);
            value = static_cast<T>(value >> 8);
        }
        break;
    }
}

}  // namespace wirebuf

#endif  // WIREBUF_BYTES_HPP_
