#ifndef WIREBUF_PAIR_HPP_
#define WIREBUF_PAIR_HPP_

#include <cstddef>

#include <wirebuf/reader.hpp>
#include <wirebuf/sink.hpp>
#include <wirebuf/writer.hpp>

namespace wirebuf {

// A writer looped back into a reader, to exercise protocol code without I/O.
// Whatever is written shows up in the reader after writer().flush().
class Pair {
public:
    explicit Pair(size_t capacity = Reader::kDefaultCapacity);

    Pair(Pair const&) = delete;
    Pair& operator=(Pair const&) = delete;

    auto reader() -> Reader& { return reader_; }
    auto writer() -> Writer& { return writer_; }

private:
    FillableReader reader_;
    ReaderSink sink_;
    Writer writer_;
};

}  // namespace wirebuf

#endif  // WIREBUF_PAIR_HPP_
