#ifndef WIREBUF_OPENSSL_EXCEPTIONS_HPP_
#define WIREBUF_OPENSSL_EXCEPTIONS_HPP_

#include <wirebuf/exceptions.hpp>

namespace wirebuf {

// message followed by the pending OpenSSL error queue
class OpenSslError : public WirebufException {
public:
    explicit OpenSslError(char const *message);
};

}  // namespace wirebuf

#endif  // WIREBUF_OPENSSL_EXCEPTIONS_HPP_
