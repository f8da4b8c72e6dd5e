#ifndef WIREBUF_CONNECTION_FACTORY_HPP_
#define WIREBUF_CONNECTION_FACTORY_HPP_

#include <map>
#include <string>
#include <vector>

#include <wirebuf/connection.hpp>
#include <wirebuf/connection_config.hpp>

namespace wirebuf {

class ConnectionFactory {
public:
    using CreatorFunc = ConnectionPtr(*)(ConnectionConfig const&);

    // nullptr for an unknown driver, throws if connecting fails
    static auto create(std::string const& driver, ConnectionConfig const& config) -> ConnectionPtr;

    static auto drivers() -> std::vector<std::string>;

private:
    static ConnectionFactory& instance();

    std::map<std::string, CreatorFunc> registry_;

    ConnectionFactory();
};

}  // namespace wirebuf

#endif  // WIREBUF_CONNECTION_FACTORY_HPP_
