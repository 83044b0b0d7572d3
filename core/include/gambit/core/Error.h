#pragma once

#include <string>

namespace gambit::core {

enum class ErrorKind {
    kNone,
    kPairingInfeasible,
    kResultMismatch,
    kInvalidResult,
    kUnknownFederationCode,
    kDuplicateFederationCode,
    kInsufficientSamples,
    kDuplicatePlayer,
    kUnknownPlayer,
    kInvalidArgument,
    kInvalidConfig,
    kIoError,
};

struct EngineError {
    ErrorKind kind = ErrorKind::kNone;
    std::string message;
};

const char* ErrorKindName(ErrorKind kind);

// Fills *error when it is non-null and always returns false, so call sites can
// write `return Fail(error, kind, "...");`.
bool Fail(EngineError* error, ErrorKind kind, const std::string& message);

std::string Describe(const EngineError& error);

}  // namespace gambit::core
