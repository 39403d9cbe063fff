#pragma once
#include <cstdint>
namespace qkdnet::protocol::enums {
enum class ReconciliationMethod : uint8_t {
    Cascade = 0,
    Ldpc = 1
};
inline const char* ToString(ReconciliationMethod method) {
    switch (method) {
        case ReconciliationMethod::Cascade:
            return "Cascade";
        case ReconciliationMethod::Ldpc:
            return "LDPC";
        default:
            return "UNKNOWN";
    }
}
}
