#include "connection.hpp"

#include <memory>

#include <openssl/opensslv.h>
#include <spdlog/spdlog.h>

#include "exceptions.hpp"

static_assert(OPENSSL_VERSION_NUMBER >= 0x10100000L, "Use OpenSSL version 1.1.0 or later");

namespace wirebuf {

namespace {

auto connect(ConnectionConfig const& config) -> BioPtr
{
    BioPtr bio{BIO_new(BIO_s_connect())};
    if (!bio) {
        throw OpenSslError{"error BIO_new"};
    }

    if (BIO_set_conn_hostname(bio.get(), config.host().c_str()) < 1) {
        throw OpenSslError{"error BIO_set_conn_hostname"};
    }
    if (BIO_set_conn_port(bio.get(), config.port().c_str()) < 1) {
        throw OpenSslError{"error BIO_set_conn_port"};
    }

    spdlog::info("Connecting to {}:{}", config.host(), config.port());
    if (BIO_do_connect(bio.get()) < 1) {
        throw OpenSslError{"error BIO_do_connect"};
    }
    return bio;
}

}  // namespace

auto OpenSslConnection::create(ConnectionConfig const& config) -> ConnectionPtr
{
    spdlog::debug("Creating connection with {}", OPENSSL_VERSION_TEXT);
    return std::make_unique<OpenSslConnection>(config);
}

OpenSslConnection::OpenSslConnection(ConnectionConfig const& config)
    : bio_{connect(config)}
    , source_{bio_.get(), config.readChunkSize()}
    , sink_{bio_.get()}
{
}

}  // namespace wirebuf
