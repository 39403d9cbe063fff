#include "qkdnet/crypto/privacy_amplifier.hpp"
#include "qkdnet/crypto/sodium_interop.hpp"
#include "qkdnet/core/constants.hpp"

namespace qkdnet::protocol::crypto {

Result<std::vector<uint8_t>, ProtocolFailure> PrivacyAmplifier::Amplify(
    std::span<const uint8_t> reconciled_key,
    const size_t output_length,
    std::span<const uint8_t> seed) {

    if (reconciled_key.empty()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Privacy amplification input key is empty"));
    }
    if (seed.empty()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Privacy amplification seed is empty"));
    }
    if (output_length == 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Privacy amplification output length must be positive"));
    }

    std::vector<uint8_t> block_input;
    block_input.reserve(seed.size() + reconciled_key.size() + sizeof(uint32_t));
    block_input.insert(block_input.end(), seed.begin(), seed.end());
    block_input.insert(block_input.end(), reconciled_key.begin(), reconciled_key.end());
    const size_t counter_offset = block_input.size();
    block_input.resize(counter_offset + sizeof(uint32_t));

    std::vector<uint8_t> output;
    output.reserve(output_length + Constants::SHA_256_DIGEST_SIZE);
    for (uint32_t counter = 0; output.size() < output_length; ++counter) {
        block_input[counter_offset] = static_cast<uint8_t>(counter >> 24);
        block_input[counter_offset + 1] = static_cast<uint8_t>(counter >> 16);
        block_input[counter_offset + 2] = static_cast<uint8_t>(counter >> 8);
        block_input[counter_offset + 3] = static_cast<uint8_t>(counter);
        const auto block = SodiumInterop::Sha256(block_input);
        output.insert(output.end(), block.begin(), block.end());
    }
    output.resize(output_length);

    if (auto wipe_result = SodiumInterop::SecureWipe(block_input); wipe_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(wipe_result.UnwrapErr()));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

std::vector<uint8_t> PrivacyAmplifier::GenerateSeed() {
    return SodiumInterop::GetRandomBytes(Constants::PRIVACY_AMPLIFICATION_SEED_SIZE);
}

size_t PrivacyAmplifier::MaxSecureOutputLength(
    const size_t key_bits,
    const size_t leaked_bits,
    const size_t security_margin_bits) noexcept {
    const size_t spent = leaked_bits + security_margin_bits;
    if (spent >= key_bits) {
        return 0;
    }
    return (key_bits - spent) / Constants::BITS_PER_BYTE;
}

}
