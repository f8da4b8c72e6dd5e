#include "utils.hpp"

#include <cctype>
#include <limits>

#include <spdlog/fmt/fmt.h>

#include <wirebuf/exceptions.hpp>

namespace wirebuf::utils {

auto asciiToLower(uint8_t c) -> uint8_t
{
    if (c >= 'A' && c <= 'Z') {
        return static_cast<uint8_t>(c - 'A' + 'a');
    }
    return c;
}

void accumulateDigit(uint64_t& value, uint8_t digit)
{
    if (digit < '0' || digit > '9') {
        throw InvalidTokenError{fmt::format("unexpected byte 0x{:02X} in integer token", digit)};
    }

    auto const d = static_cast<uint64_t>(digit - '0');
    if (value > (std::numeric_limits<uint64_t>::max() - d) / 10) {
        throw InvalidTokenError{"integer token out of range"};
    }
    value = value * 10 + d;
}

auto hexDump(std::string_view bytes, size_t columns) -> std::string
{
    if (columns == 0) {
        columns = 16;
    }

    std::string result;
    for (size_t offset = 0; offset < bytes.size(); offset += columns) {
        auto const line = bytes.substr(offset, columns);

        result += fmt::format("{:08X}: ", offset);
        for (size_t i = 0; i < columns; i++) {
            if (i < line.size()) {
                result += fmt::format("{:02X} ", static_cast<uint8_t>(line[i]));
            } else {
                result += "   ";
            }
        }

        result += ' ';
        for (char const c : line) {
            result += std::isprint(static_cast<unsigned char>(c)) ? c : '.';
        }
        result += '\n';
    }
    return result;
}

}  // namespace wirebuf::utils
