#include "common/protocols/IspError.hpp"

namespace common {

namespace {

const char* getWhatString(int errorCode)
{
    switch(errorCode) {
    case IspError::ErrorCode::IncompleteSend:
        return "Incomplete send";
    case IspError::ErrorCode::NoResponse:
        return "No response";
    case IspError::ErrorCode::UnknownKind:
        return "Unknown kind";
    case IspError::ErrorCode::TruncatedFrame:
        return "Truncated frame";
    case IspError::ErrorCode::PayloadTooLong:
        return "Payload too long";
    case IspError::ErrorCode::BadFraming:
        return "Bad framing";
    case IspError::ErrorCode::BadChecksum:
        return "Bad checksum";
    }
    return "";
}

std::string makeWhat(ErrorKind kind, const std::string& message, int errorCode)
{
    std::string result{ toString(kind) };
    const std::string detail{ getWhatString(errorCode) };
    if(!detail.empty()) {
        result += " (" + detail + ")";
    }
    if(!message.empty()) {
        result += ": " + message;
    }
    return result;
}

}

IspError::IspError(ErrorKind kind, const std::string& message, int errorCode, uint8_t status)
    : std::runtime_error{ makeWhat(kind, message, errorCode) }
    , _kind{ kind }
    , _errorCode{ errorCode }
    , _status{ status }
    , _message{ message }
{
}

ErrorKind IspError::getKind() const noexcept
{
    return _kind;
}

int IspError::getErrorCode() const noexcept
{
    return _errorCode;
}

uint8_t IspError::getStatus() const noexcept
{
    return _status;
}

const std::string& IspError::getMessage() const noexcept
{
    return _message;
}

std::string toString(ErrorKind kind)
{
    switch(kind) {
    case ErrorKind::TransportFailure:
        return "Transport failure";
    case ErrorKind::ProtocolDecodeError:
        return "Protocol decode error";
    case ErrorKind::KindMismatch:
        return "Kind mismatch";
    case ErrorKind::DeviceRejected:
        return "Device rejected";
    case ErrorKind::VerificationMismatch:
        return "Verification mismatch";
    case ErrorKind::UnsupportedFeature:
        return "Unsupported feature";
    }
    return {};
}

} // namespace common
