#ifndef WIREBUF_MBEDTLS_CORE_HPP_
#define WIREBUF_MBEDTLS_CORE_HPP_

#include <mbedtls/net_sockets.h>

namespace wirebuf {

template <typename T, void (*InitFunc)(T *), void (*FreeFunc)(T *)>
class MbedTlsObject {
public:
    MbedTlsObject() { InitFunc(&object_); }
    ~MbedTlsObject() { FreeFunc(&object_); }

    MbedTlsObject(MbedTlsObject const&) = delete;
    MbedTlsObject& operator=(MbedTlsObject const&) = delete;

    T *get() { return &object_; }
    T const *get() const { return &object_; }

private:
    T object_;
};

using NetContext = MbedTlsObject<mbedtls_net_context, mbedtls_net_init, mbedtls_net_free>;

}  // namespace wirebuf

#endif  // WIREBUF_MBEDTLS_CORE_HPP_
