#ifndef WIREBUF_OPENSSL_CONNECTION_HPP_
#define WIREBUF_OPENSSL_CONNECTION_HPP_

#include <wirebuf/connection.hpp>
#include <wirebuf/connection_config.hpp>
#include "core.hpp"
#include "stream.hpp"

namespace wirebuf {

// plain TCP through a connect BIO
class OpenSslConnection : public Connection {
public:
    static auto create(ConnectionConfig const& config) -> ConnectionPtr;

    explicit OpenSslConnection(ConnectionConfig const& config);

    auto source() -> Source& override { return source_; }
    auto sink() -> Sink& override { return sink_; }

private:
    BioPtr bio_;
    BioSource source_;
    BioSink sink_;
};

}  // namespace wirebuf

#endif  // WIREBUF_OPENSSL_CONNECTION_HPP_
