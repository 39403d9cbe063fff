#pragma once
#include "qkdnet/enums/session_phase.hpp"
#include <string>
namespace qkdnet::protocol::interfaces {
class ISessionEventHandler {
public:
    virtual ~ISessionEventHandler() = default;
    virtual void OnPhaseChanged(
        const std::string& session_id,
        enums::SessionPhase from,
        enums::SessionPhase to) = 0;
    virtual void OnSessionAborted(const std::string& session_id, const std::string& reason) = 0;
};
}
