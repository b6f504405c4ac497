// FlowError.hpp
//
// Synchronous errors raised by graph edits, node configuration and learning.
// Every operation that throws a FlowError leaves its target unchanged.
#pragma once
#include <stdexcept>
#include <string>

namespace MidiFlow {

enum class ErrorCode {
    InvalidConfig,
    TypeMismatch,
    PortOccupied,
    CycleDetected,
    NotFound,
    LearnInProgress
};

const char* errorCodeName(ErrorCode code);

class FlowError : public std::runtime_error {
public:
    FlowError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(errorCodeName(code)) + ": " + message), errorCode(code) {}

    ErrorCode code() const { return errorCode; }

private:
    ErrorCode errorCode;
};

} // namespace MidiFlow
