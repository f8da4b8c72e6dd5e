#ifndef WIREBUF_CHUNK_HPP_
#define WIREBUF_CHUNK_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <wirebuf/bytes.hpp>

namespace wirebuf {

// Immutable slice of shared byte storage.
// Copies and sub-slices share the storage, bytes are never copied.
class Chunk {
public:
    Chunk() = default;

    explicit Chunk(Bytes bytes);
    explicit Chunk(std::string_view view);

    // storage bytes in [offset, offset + size) must never change afterwards
    Chunk(std::shared_ptr<Bytes const> storage, size_t offset, size_t size);

    auto data() const -> uint8_t const *;
    auto size() const -> size_t { return size_; }
    auto empty() const -> bool { return size_ == 0; }

    auto operator[](size_t index) const -> uint8_t { return this->data()[index]; }

    auto view() const -> std::string_view;

    // throws std::out_of_range
    auto slice(size_t offset, size_t size) const -> Chunk;

    auto toString() const -> std::string;
    auto toBytes() const -> Bytes;

    auto operator==(Chunk const& rhs) const -> bool { return this->view() == rhs.view(); }
    auto operator!=(Chunk const& rhs) const -> bool { return !(*this == rhs); }

private:
    std::shared_ptr<Bytes const> storage_;
    size_t offset_{0};
    size_t size_{0};
};

}  // namespace wirebuf

#endif  // WIREBUF_CHUNK_HPP_
