#ifndef WIREBUF_MBEDTLS_EXCEPTIONS_HPP_
#define WIREBUF_MBEDTLS_EXCEPTIONS_HPP_

#include <string>

#include <wirebuf/exceptions.hpp>

namespace wirebuf {

auto mbedTlsTranslateError(int error) -> std::string;

class MbedTlsError : public WirebufException {
public:
    MbedTlsError(char const *message, int error);

    auto code() const -> int { return error_; }

private:
    int error_;
};

}  // namespace wirebuf

#endif  // WIREBUF_MBEDTLS_EXCEPTIONS_HPP_
