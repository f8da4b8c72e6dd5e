#include <wirebuf/connection_factory.hpp>

#include <wirebuf/connection.hpp>

#include "openssl/connection.hpp"
#ifdef WIREBUF_WITH_MBEDTLS
#include "mbedtls/connection.hpp"
#endif

namespace wirebuf {

ConnectionFactory& ConnectionFactory::instance()
{
    static ConnectionFactory instance;
    return instance;
}

ConnectionFactory::ConnectionFactory()
{
    registry_["openssl"] = OpenSslConnection::create;
#ifdef WIREBUF_WITH_MBEDTLS
    registry_["mbedtls"] = MbedTlsConnection::create;
#endif
}

auto ConnectionFactory::create(std::string const& driver, ConnectionConfig const& config) -> ConnectionPtr
{
    auto& registry = ConnectionFactory::instance().registry_;

    if (auto const iter = registry.find(driver); iter != std::end(registry)) {
        return iter->second(config);
    }
    return nullptr;
}

auto ConnectionFactory::drivers() -> std::vector<std::string>
{
    std::vector<std::string> result;
    for (auto const& e : ConnectionFactory::instance().registry_) {
        result.push_back(e.first);
    }
    return result;
}

}  // namespace wirebuf
