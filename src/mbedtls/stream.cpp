#include "stream.hpp"

#include <algorithm>
#include <stdexcept>

#include <mbedtls/ssl.h>
#include <spdlog/spdlog.h>

#include <wirebuf/exceptions.hpp>
#include "exceptions.hpp"
#include "../utils.hpp"

namespace wirebuf {

NetSource::NetSource(mbedtls_net_context *ctx, size_t readChunkSize)
    : ctx_{ctx}, readChunkSize_{readChunkSize}
{
    if (ctx_ == nullptr) {
        throw std::invalid_argument{"null net context"};
    }
}

auto NetSource::emit(uint8_t *data, size_t size) -> size_t
{
    int const n = mbedtls_net_recv(ctx_, data, std::min(size, readChunkSize_));
    if (n > 0) {
        spdlog::debug("Received {} bytes", n);
        if (spdlog::should_log(spdlog::level::trace)) {
            spdlog::trace("\n{}", utils::hexDump({reinterpret_cast<char const *>(data), static_cast<size_t>(n)}));
        }
        return static_cast<size_t>(n);
    }
    if (n == 0) {
        throw SourceClosedError{};
    }
    // reported for EAGAIN and EINTR
    if (n == MBEDTLS_ERR_SSL_WANT_READ) {
        return 0;
    }
    throw MbedTlsError{"error reading data", n};
}

NetSink::NetSink(mbedtls_net_context *ctx)
    : ctx_{ctx}
{
    if (ctx_ == nullptr) {
        throw std::invalid_argument{"null net context"};
    }
}

auto NetSink::push(uint8_t const *data, size_t size) -> size_t
{
    int const n = mbedtls_net_send(ctx_, data, size);
    if (n > 0) {
        spdlog::debug("Sent {} bytes", n);
        return static_cast<size_t>(n);
    }
    if (n == 0 || n == MBEDTLS_ERR_SSL_WANT_WRITE) {
        return 0;
    }
    throw MbedTlsError{"error writing data", n};
}

}  // namespace wirebuf
