#include "common/protocols/IspResponse.hpp"

#include "common/protocols/IspError.hpp"
#include "common/Util.hpp"

#include <string>

namespace common {

IspResponse IspResponse::fromRaw(const std::vector<uint8_t>& raw)
{
    if(raw.size() < HeaderSize) {
        throw IspError(ErrorKind::ProtocolDecodeError, "response of " + std::to_string(raw.size()) + " bytes",
                       IspError::ErrorCode::TruncatedFrame);
    }
    const auto type{ parseIspCommandType(raw[0]) };
    if(!type) {
        throw IspError(ErrorKind::ProtocolDecodeError, "kind " + toHexString(raw[0]),
                       IspError::ErrorCode::UnknownKind);
    }
    const size_t payloadSize{ raw[1] };
    const uint8_t status{ raw[2] };
    if(raw.size() < HeaderSize + payloadSize) {
        throw IspError(ErrorKind::ProtocolDecodeError,
                       "declared " + std::to_string(payloadSize) + " payload bytes, got "
                           + std::to_string(raw.size() - HeaderSize),
                       IspError::ErrorCode::TruncatedFrame);
    }
    return { *type, status, std::vector<uint8_t>(raw.cbegin() + HeaderSize, raw.cbegin() + HeaderSize + payloadSize) };
}

IspResponse::IspResponse(IspCommandType type, uint8_t status, std::vector<uint8_t>&& payload)
    : _type{ type }
    , _status{ status }
    , _payload{ std::move(payload) }
{
}

IspCommandType IspResponse::getType() const
{
    return _type;
}

uint8_t IspResponse::getStatus() const
{
    return _status;
}

const std::vector<uint8_t>& IspResponse::getPayload() const
{
    return _payload;
}

bool IspResponse::isOk() const
{
    return _status == 0x00;
}

std::vector<uint8_t> IspResponse::toRaw() const
{
    std::vector<uint8_t> raw{ static_cast<uint8_t>(_type), static_cast<uint8_t>(_payload.size()), _status, 0x00 };
    raw.insert(raw.end(), _payload.cbegin(), _payload.cend());
    return raw;
}

} // namespace common
