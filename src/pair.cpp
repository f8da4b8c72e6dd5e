#include <wirebuf/pair.hpp>

namespace wirebuf {

Pair::Pair(size_t capacity)
    : reader_{capacity}
    , sink_{reader_}
    , writer_{sink_}
{
}

}  // namespace wirebuf
