#include "stream.hpp"

#include <algorithm>
#include <climits>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include <wirebuf/exceptions.hpp>
#include "exceptions.hpp"
#include "../utils.hpp"

namespace wirebuf {

BioSource::BioSource(BIO *bio, size_t readChunkSize)
    : bio_{bio}, readChunkSize_{readChunkSize}
{
    if (bio_ == nullptr) {
        throw std::invalid_argument{"null BIO"};
    }
}

auto BioSource::emit(uint8_t *data, size_t size) -> size_t
{
    auto const request = static_cast<int>(std::min({size, readChunkSize_, static_cast<size_t>(INT_MAX)}));

    int const n = BIO_read(bio_, data, request);
    if (n > 0) {
        spdlog::debug("Received {} bytes", n);
        if (spdlog::should_log(spdlog::level::trace)) {
            spdlog::trace("\n{}", utils::hexDump({reinterpret_cast<char const *>(data), static_cast<size_t>(n)}));
        }
        return static_cast<size_t>(n);
    }
    if (BIO_should_retry(bio_)) {
        return 0;
    }
    if (n == 0) {
        throw SourceClosedError{};
    }
    throw OpenSslError{"error reading data"};
}

BioSink::BioSink(BIO *bio)
    : bio_{bio}
{
    if (bio_ == nullptr) {
        throw std::invalid_argument{"null BIO"};
    }
}

auto BioSink::push(uint8_t const *data, size_t size) -> size_t
{
    auto const request = static_cast<int>(std::min(size, static_cast<size_t>(INT_MAX)));

    int const n = BIO_write(bio_, data, request);
    if (n > 0) {
        spdlog::debug("Sent {} bytes", n);
        return static_cast<size_t>(n);
    }
    if (BIO_should_retry(bio_)) {
        return 0;
    }
    throw OpenSslError{"error writing data"};
}

void BioSink::pushed()
{
    if (BIO_flush(bio_) < 1 && !BIO_should_retry(bio_)) {
        throw OpenSslError{"error BIO_flush"};
    }
}

}  // namespace wirebuf
