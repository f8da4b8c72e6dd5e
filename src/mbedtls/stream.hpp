#ifndef WIREBUF_MBEDTLS_STREAM_HPP_
#define WIREBUF_MBEDTLS_STREAM_HPP_

#include <cstddef>
#include <cstdint>

#include <mbedtls/net_sockets.h>

#include <wirebuf/sink.hpp>
#include <wirebuf/source.hpp>

namespace wirebuf {

class NetSource : public Source {
public:
    // not owning
    NetSource(mbedtls_net_context *ctx, size_t readChunkSize);

    auto emit(uint8_t *data, size_t size) -> size_t override;

private:
    mbedtls_net_context *ctx_;
    size_t readChunkSize_;
};

class NetSink : public PushSink {
public:
    // not owning
    explicit NetSink(mbedtls_net_context *ctx);

private:
    mbedtls_net_context *ctx_;

    auto push(uint8_t const *data, size_t size) -> size_t override;
};

}  // namespace wirebuf

#endif  // WIREBUF_MBEDTLS_STREAM_HPP_
