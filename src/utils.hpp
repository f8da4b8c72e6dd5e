#ifndef WIREBUF_UTILS_HPP_
#define WIREBUF_UTILS_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace wirebuf::utils {

auto asciiToLower(uint8_t c) -> uint8_t;

// value = value * 10 + digit, throws InvalidTokenError on non-digit or overflow
void accumulateDigit(uint64_t& value, uint8_t digit);

// "00000000: 48 65 0A  He." style lines, for logging raw bytes
auto hexDump(std::string_view bytes, size_t columns = 16) -> std::string;

}  // namespace wirebuf::utils

#endif  // WIREBUF_UTILS_HPP_
