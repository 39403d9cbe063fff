#pragma once
#include <cstdint>
#include <string>
#include <vector>
namespace qkdnet::protocol::models {
/// Output of an external raw-key source. The bytes never leave the session.
struct RawKeyMaterial {
    std::vector<uint8_t> bytes;
    double fidelity = 0.0;
    std::string source_id;
};
}
