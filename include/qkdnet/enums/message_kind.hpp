#pragma once
#include <cstdint>
namespace qkdnet::protocol::enums {
enum class MessageKind : uint8_t {
    InitRequest = 0,
    InitResponse = 1,
    AuthChallenge = 2,
    AuthResponse = 3,
    KeyGenRequest = 4,
    KeyGenResponse = 5,
    ErrorDetect = 6,
    ErrorCorrect = 7,
    PrivacyAmp = 8,
    KeyVerify = 9,
    KeyConfirm = 10
};
inline const char* ToString(MessageKind kind) {
    switch (kind) {
        case MessageKind::InitRequest:
            return "InitRequest";
        case MessageKind::InitResponse:
            return "InitResponse";
        case MessageKind::AuthChallenge:
            return "AuthChallenge";
        case MessageKind::AuthResponse:
            return "AuthResponse";
        case MessageKind::KeyGenRequest:
            return "KeyGenRequest";
        case MessageKind::KeyGenResponse:
            return "KeyGenResponse";
        case MessageKind::ErrorDetect:
            return "ErrorDetect";
        case MessageKind::ErrorCorrect:
            return "ErrorCorrect";
        case MessageKind::PrivacyAmp:
            return "PrivacyAmp";
        case MessageKind::KeyVerify:
            return "KeyVerify";
        case MessageKind::KeyConfirm:
            return "KeyConfirm";
        default:
            return "UNKNOWN";
    }
}
}
