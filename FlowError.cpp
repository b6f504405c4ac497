// FlowError.cpp
#include "FlowError.hpp"

namespace MidiFlow {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::TypeMismatch: return "TypeMismatch";
        case ErrorCode::PortOccupied: return "PortOccupied";
        case ErrorCode::CycleDetected: return "CycleDetected";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::LearnInProgress: return "LearnInProgress";
    }
    return "Unknown";
}

} // namespace MidiFlow
