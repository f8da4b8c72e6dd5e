#ifndef WIREBUF_SOURCE_HPP_
#define WIREBUF_SOURCE_HPP_

#include <cstddef>
#include <cstdint>

namespace wirebuf {

class Source {
public:
    virtual ~Source() = default;

    // Writes at most size bytes into data, returns the number written.
    // Zero means nothing is available right now.
    // throws SourceClosedError once closed
    virtual auto emit(uint8_t *data, size_t size) -> size_t = 0;
};

}  // namespace wirebuf

#endif  // WIREBUF_SOURCE_HPP_
