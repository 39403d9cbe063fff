#pragma once
#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"
#include "qkdnet/models/raw_key_material.hpp"
#include <cstdint>
namespace qkdnet::protocol::interfaces {
using protocol::Result;
using protocol::ProtocolFailure;
/// Producer of raw correlated key material. May block; the session bounds the wait.
class IRawKeySource {
public:
    virtual ~IRawKeySource() = default;
    [[nodiscard]] virtual Result<models::RawKeyMaterial, ProtocolFailure> GenerateRawKey(
        uint32_t shot_count,
        bool use_hardware) = 0;
};
}
