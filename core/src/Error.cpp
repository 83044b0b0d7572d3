#include "gambit/core/Error.h"

namespace gambit::core {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone:
            return "None";
        case ErrorKind::kPairingInfeasible:
            return "PairingInfeasible";
        case ErrorKind::kResultMismatch:
            return "ResultMismatch";
        case ErrorKind::kInvalidResult:
            return "InvalidResult";
        case ErrorKind::kUnknownFederationCode:
            return "UnknownFederationCode";
        case ErrorKind::kDuplicateFederationCode:
            return "DuplicateFederationCode";
        case ErrorKind::kInsufficientSamples:
            return "InsufficientSamples";
        case ErrorKind::kDuplicatePlayer:
            return "DuplicatePlayer";
        case ErrorKind::kUnknownPlayer:
            return "UnknownPlayer";
        case ErrorKind::kInvalidArgument:
            return "InvalidArgument";
        case ErrorKind::kInvalidConfig:
            return "InvalidConfig";
        case ErrorKind::kIoError:
            return "IoError";
    }
    return "Unknown";
}

bool Fail(EngineError* error, ErrorKind kind, const std::string& message) {
    if (error) {
        error->kind = kind;
        error->message = message;
    }
    return false;
}

std::string Describe(const EngineError& error) {
    return std::string(ErrorKindName(error.kind)) + ": " + error.message;
}

}  // namespace gambit::core
