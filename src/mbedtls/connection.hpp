#ifndef WIREBUF_MBEDTLS_CONNECTION_HPP_
#define WIREBUF_MBEDTLS_CONNECTION_HPP_

#include <memory>

#include <wirebuf/connection.hpp>
#include <wirebuf/connection_config.hpp>
#include "core.hpp"
#include "stream.hpp"

namespace wirebuf {

// plain TCP through mbedtls_net
class MbedTlsConnection : public Connection {
public:
    static auto create(ConnectionConfig const& config) -> ConnectionPtr;

    explicit MbedTlsConnection(ConnectionConfig const& config);

    auto source() -> Source& override { return source_; }
    auto sink() -> Sink& override { return sink_; }

private:
    std::unique_ptr<NetContext> net_;
    NetSource source_;
    NetSink sink_;
};

}  // namespace wirebuf

#endif  // WIREBUF_MBEDTLS_CONNECTION_HPP_
