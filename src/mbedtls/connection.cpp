#include "connection.hpp"

#include <mbedtls/version.h>
#include <spdlog/spdlog.h>

#include "exceptions.hpp"

namespace wirebuf {

namespace {

auto connect(ConnectionConfig const& config) -> std::unique_ptr<NetContext>
{
    auto net = std::make_unique<NetContext>();

    spdlog::info("Connecting to {}:{}", config.host(), config.port());
    if (auto const err = mbedtls_net_connect(net->get(), config.host().c_str(), config.port().c_str(), MBEDTLS_NET_PROTO_TCP); err != 0) {
        throw MbedTlsError{"mbedtls_net_connect", err};
    }
    return net;
}

}  // namespace

auto MbedTlsConnection::create(ConnectionConfig const& config) -> ConnectionPtr
{
    spdlog::debug("Creating connection with {}", MBEDTLS_VERSION_STRING_FULL);
    return std::make_unique<MbedTlsConnection>(config);
}

MbedTlsConnection::MbedTlsConnection(ConnectionConfig const& config)
    : net_{connect(config)}
    , source_{net_->get(), config.readChunkSize()}
    , sink_{net_->get()}
{
}

}  // namespace wirebuf
