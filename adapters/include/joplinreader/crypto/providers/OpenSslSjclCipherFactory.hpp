#ifndef INCLUDE_JOPLINREADER_CRYPTO_PROVIDERS_OPENSSLSJCLCIPHERFACTORY_HPP
#define INCLUDE_JOPLINREADER_CRYPTO_PROVIDERS_OPENSSLSJCLCIPHERFACTORY_HPP

#include "joplinreader/crypto/ICipher.hpp"
#include <memory>

namespace joplinreader::crypto::providers
{

// SJCL-compatible envelopes (JSON, PBKDF2-HMAC-SHA256, AES-CCM) on top of OpenSSL 3.
[[nodiscard]] std::unique_ptr<joplinreader::crypto::ICipher> makeOpenSslSjclCipher();

} // namespace joplinreader::crypto::providers

#endif // INCLUDE_JOPLINREADER_CRYPTO_PROVIDERS_OPENSSLSJCLCIPHERFACTORY_HPP
