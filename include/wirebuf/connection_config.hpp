#ifndef WIREBUF_CONNECTION_CONFIG_HPP_
#define WIREBUF_CONNECTION_CONFIG_HPP_

#include <cstddef>
#include <string>
#include <utility>

namespace wirebuf {

class ConnectionConfig {
public:
    class Builder;

    static constexpr size_t kDefaultReadChunkSize = 4096;

    ConnectionConfig(std::string host, std::string port, size_t readChunkSize)
        : host_{std::move(host)}, port_{std::move(port)}
        , readChunkSize_{readChunkSize}
    {
    }

    auto host() const -> std::string const& { return host_; }
    auto port() const -> std::string const& { return port_; }
    // upper bound for a single read from the peer
    auto readChunkSize() const { return readChunkSize_; }

private:
    std::string host_;
    std::string port_;
    size_t readChunkSize_;
};

class ConnectionConfig::Builder {
public:
    auto build() const {
        return ConnectionConfig{host_, port_, readChunkSize_};
    }

    auto host(std::string value) -> Builder& { host_ = std::move(value); return *this; }
    auto port(std::string value) -> Builder& { port_ = std::move(value); return *this; }
    auto readChunkSize(size_t value) -> Builder& { readChunkSize_ = value > 0 ? value : kDefaultReadChunkSize; return *this; }

private:
    std::string host_{"localhost"};
    std::string port_;
    size_t readChunkSize_{kDefaultReadChunkSize};
};

}  // namespace wirebuf

#endif  // WIREBUF_CONNECTION_CONFIG_HPP_
