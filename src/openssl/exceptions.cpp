#include "exceptions.hpp"

#include <string>

#include <openssl/err.h>
#include <spdlog/spdlog.h>

namespace wirebuf {

namespace {

auto drainErrorQueue(char const *message) -> std::string
{
    std::string result{message};
    while (auto const code = ERR_get_error()) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        result += ": ";
        result += buffer;
    }
    return result;
}

}  // namespace

OpenSslError::OpenSslError(char const *message)
    : WirebufException{drainErrorQueue(message)}
{
    spdlog::error("{}", this->what());
}

}  // namespace wirebuf
