#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace common {

enum class ErrorKind {
    TransportFailure,
    ProtocolDecodeError,
    KindMismatch,
    DeviceRejected,
    VerificationMismatch,
    UnsupportedFeature
};

class IspError: public std::runtime_error {
public:
    struct ErrorCode {
        static constexpr int Generic = 0x00;
        static constexpr int IncompleteSend = 0x01;
        static constexpr int NoResponse = 0x02;
        static constexpr int UnknownKind = 0x10;
        static constexpr int TruncatedFrame = 0x11;
        static constexpr int PayloadTooLong = 0x12;
        static constexpr int BadFraming = 0x13;
        static constexpr int BadChecksum = 0x14;
    };

    IspError(ErrorKind kind, const std::string& message, int errorCode = ErrorCode::Generic, uint8_t status = 0);

    ErrorKind getKind() const noexcept;
    int getErrorCode() const noexcept;
    uint8_t getStatus() const noexcept;
    const std::string& getMessage() const noexcept;

private:
    ErrorKind _kind;
    int _errorCode;
    uint8_t _status;
    std::string _message;
};

std::string toString(ErrorKind kind);

} // namespace common
