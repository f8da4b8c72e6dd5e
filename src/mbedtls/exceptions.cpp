#include "exceptions.hpp"

#include <array>

#include <mbedtls/error.h>
#include <spdlog/spdlog.h>

namespace wirebuf {

auto mbedTlsTranslateError(int error) -> std::string
{
    std::array<char, 256> buffer;
    mbedtls_strerror(error, buffer.data(), buffer.size());
    return buffer.data();
}

MbedTlsError::MbedTlsError(char const *message, int error)
    : WirebufException{std::string{message} + ": " + mbedTlsTranslateError(error)}
    , error_{error}
{
    spdlog::error("{} ({})", this->what(), error);
}

}  // namespace wirebuf
