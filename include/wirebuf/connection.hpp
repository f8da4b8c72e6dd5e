#ifndef WIREBUF_CONNECTION_HPP_
#define WIREBUF_CONNECTION_HPP_

#include <memory>

namespace wirebuf {

class Sink;
class Source;

// A connected byte stream: bytes come in through source(), go out through sink().
class Connection {
public:
    virtual ~Connection() = default;

    virtual auto source() -> Source& = 0;
    virtual auto sink() -> Sink& = 0;
};

using ConnectionPtr = std::unique_ptr<Connection>;

}  // namespace wirebuf

#endif  // WIREBUF_CONNECTION_HPP_
