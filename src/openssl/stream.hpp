#ifndef WIREBUF_OPENSSL_STREAM_HPP_
#define WIREBUF_OPENSSL_STREAM_HPP_

#include <cstddef>
#include <cstdint>

#include <openssl/bio.h>

#include <wirebuf/sink.hpp>
#include <wirebuf/source.hpp>

namespace wirebuf {

class BioSource : public Source {
public:
    // not owning
    BioSource(BIO *bio, size_t readChunkSize);

    auto emit(uint8_t *data, size_t size) -> size_t override;

private:
    BIO *bio_;
    size_t readChunkSize_;
};

class BioSink : public PushSink {
public:
    // not owning
    explicit BioSink(BIO *bio);

private:
    BIO *bio_;

    auto push(uint8_t const *data, size_t size) -> size_t override;
    void pushed() override;
};

}  // namespace wirebuf

#endif  // WIREBUF_OPENSSL_STREAM_HPP_
