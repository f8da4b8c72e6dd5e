#include <wirebuf/chunk.hpp>

#include <stdexcept>
#include <utility>

namespace wirebuf {

Chunk::Chunk(Bytes bytes)
    : size_{bytes.size()}
{
    storage_ = std::make_shared<Bytes const>(std::move(bytes));
}

Chunk::Chunk(std::string_view view)
    : Chunk{Bytes{std::begin(view), std::end(view)}}
{
}

Chunk::Chunk(std::shared_ptr<Bytes const> storage, size_t offset, size_t size)
    : storage_{std::move(storage)}, offset_{offset}, size_{size}
{
    if (!storage_ && size_ > 0) {
        throw std::invalid_argument{"chunk without storage"};
    }
    if (storage_ && (offset_ > storage_->size() || storage_->size() - offset_ < size_)) {
        throw std::out_of_range{"chunk exceeds its storage"};
    }
}

auto Chunk::data() const -> uint8_t const *
{
    if (!storage_) {
        return nullptr;
    }
    return storage_->data() + offset_;
}

auto Chunk::view() const -> std::string_view
{
    if (size_ == 0) {
        return {};
    }
    return {reinterpret_cast<char const *>(this->data()), size_};
}

auto Chunk::slice(size_t offset, size_t size) const -> Chunk
{
    if (offset > size_ || size_ - offset < size) {
        throw std::out_of_range{"slice exceeds chunk"};
    }
    if (size == 0) {
        return Chunk{};
    }
    return Chunk{storage_, offset_ + offset, size};
}

auto Chunk::toString() const -> std::string
{
    return std::string{this->view()};
}

auto Chunk::toBytes() const -> Bytes
{
    auto const *first = this->data();
    if (first == nullptr) {
        return {};
    }
    return Bytes{first, first + size_};
}

}  // namespace wirebuf
