#include "errors.hpp"

std::string_view ToString(EErrorCode code) {
    switch (code) {
    case EErrorCode::PersistenceError:
        return "PersistenceError";
    case EErrorCode::LockFailure:
        return "LockFailure";
    case EErrorCode::UnknownField:
        return "UnknownField";
    case EErrorCode::UnsupportedMethod:
        return "UnsupportedMethod";
    case EErrorCode::TransportError:
        return "TransportError";
    case EErrorCode::UnsupportedResponse:
        return "UnsupportedResponse";
    }
    return "Unknown";
}

CTickerError::CTickerError(EErrorCode code, const std::string& message)
    : std::runtime_error(std::string(ToString(code)) + ": " + message),
      m_code(code) {}
