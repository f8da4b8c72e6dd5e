#ifndef WIREBUF_EXCEPTIONS_HPP_
#define WIREBUF_EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>

namespace wirebuf {

class WirebufException : public std::runtime_error {
public:
    WirebufException(char const *message)
        : std::runtime_error{message}
    {
    }

    WirebufException(std::string const& message)
        : std::runtime_error{message}
    {
    }
};

// not enough bytes yet, retry after more arrive
class OutOfDataError : public WirebufException {
public:
    OutOfDataError()
        : WirebufException{"not enough data available"}
    {
    }
};

class InvalidTokenError : public WirebufException {
public:
    using WirebufException::WirebufException;
};

// some bytes are still buffered in the sink, flush again later
class IncompleteFlushError : public WirebufException {
public:
    IncompleteFlushError()
        : WirebufException{"flush did not deliver all buffered data"}
    {
    }
};

class SourceClosedError : public WirebufException {
public:
    SourceClosedError()
        : WirebufException{"source closed"}
    {
    }
};

}  // namespace wirebuf

#endif  // WIREBUF_EXCEPTIONS_HPP_
