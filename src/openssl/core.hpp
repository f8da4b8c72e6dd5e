#ifndef WIREBUF_OPENSSL_CORE_HPP_
#define WIREBUF_OPENSSL_CORE_HPP_

#include <memory>
#include <openssl/bio.h>

namespace wirebuf {

struct BioDeleter { void operator()(BIO *bio) { BIO_free_all(bio); } };
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

}  // namespace wirebuf

#endif  // WIREBUF_OPENSSL_CORE_HPP_
