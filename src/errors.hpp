#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

enum class EErrorCode {
    PersistenceError,
    LockFailure,
    UnknownField,
    UnsupportedMethod,
    TransportError,
    UnsupportedResponse
};

std::string_view ToString(EErrorCode code);

class CTickerError : public std::runtime_error {
public:
    CTickerError(EErrorCode code, const std::string& message);

    EErrorCode Code() const { return m_code; }

private:
    EErrorCode m_code;
};
