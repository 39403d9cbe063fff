#include "qkdnet/crypto/hkdf.hpp"
#include "qkdnet/core/constants.hpp"
#include "qkdnet/core/format.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <memory>
#include <string>
#include <utility>

namespace qkdnet::protocol::crypto {

namespace {
    struct KdfContextDeleter {
        void operator()(EVP_KDF_CTX* ctx) const noexcept {
            EVP_KDF_CTX_free(ctx);
        }
    };
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    const size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output_size == 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HKDF output size must be positive"));
    }

    if (output_size > MAX_OUTPUT_LEN) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("HKDF output size exceeds maximum allowed: {} > {}",
                    output_size, MAX_OUTPUT_LEN)));
    }

    if (ikm.empty()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_HKDF.data(), nullptr);
    if (!kdf) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Failed to fetch HKDF algorithm"));
    }

    std::unique_ptr<EVP_KDF_CTX, KdfContextDeleter> kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);

    if (!kctx) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;

    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OpenSSLConstants::PARAM_DIGEST.data(),
        const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256.data()), 0);

    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSLConstants::PARAM_KEY.data(), const_cast<uint8_t*>(ikm.data()), ikm.size());

    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_SALT.data(), const_cast<uint8_t*>(salt.data()), salt.size());
    }

    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_INFO.data(), const_cast<uint8_t*>(info.data()), info.size());
    }

    params[param_idx] = OSSL_PARAM_construct_end();

    std::vector<uint8_t> output(output_size);
    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("HKDF key derivation failed"));
    }

    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

} // namespace qkdnet::protocol::crypto
