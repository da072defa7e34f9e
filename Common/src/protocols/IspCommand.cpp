#include "common/protocols/IspCommand.hpp"

#include "common/protocols/IspError.hpp"
#include "common/Util.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace common {

namespace {

std::vector<uint8_t> makeAddressedPayload(uint32_t address, uint8_t padding, const std::vector<uint8_t>& data)
{
    std::vector<uint8_t> payload;
    payload.reserve(5 + data.size());
    appendLittleEndian(payload, address);
    payload.push_back(padding);
    payload.insert(payload.end(), data.cbegin(), data.cend());
    return payload;
}

}

IspCommand IspCommand::identify(uint8_t chipId, uint8_t deviceType)
{
    return { IspCommandType::Identify, { chipId, deviceType, 0, 0, 0, 0 } };
}

IspCommand IspCommand::ispEnd(uint8_t reset)
{
    return { IspCommandType::IspEnd, { reset } };
}

IspCommand IspCommand::ispKey(std::vector<uint8_t>&& keySeed)
{
    return { IspCommandType::IspKey, std::move(keySeed) };
}

IspCommand IspCommand::erase(uint32_t sectors)
{
    std::vector<uint8_t> payload;
    appendLittleEndian(payload, sectors);
    return { IspCommandType::Erase, std::move(payload) };
}

IspCommand IspCommand::program(uint32_t address, uint8_t padding, const std::vector<uint8_t>& data)
{
    return { IspCommandType::Program, makeAddressedPayload(address, padding, data) };
}

IspCommand IspCommand::verify(uint32_t address, uint8_t padding, const std::vector<uint8_t>& data)
{
    return { IspCommandType::Verify, makeAddressedPayload(address, padding, data) };
}

IspCommand IspCommand::readConfig(uint32_t mask)
{
    std::vector<uint8_t> payload;
    appendLittleEndian(payload, mask);
    return { IspCommandType::ReadConfig, std::move(payload) };
}

IspCommand IspCommand::writeConfig(uint32_t mask, const std::vector<uint8_t>& data)
{
    std::vector<uint8_t> payload;
    payload.reserve(4 + data.size());
    appendLittleEndian(payload, mask);
    payload.insert(payload.end(), data.cbegin(), data.cend());
    return { IspCommandType::WriteConfig, std::move(payload) };
}

IspCommand IspCommand::dataErase(uint16_t sectors)
{
    std::vector<uint8_t> payload;
    appendLittleEndian(payload, sectors);
    return { IspCommandType::DataErase, std::move(payload) };
}

IspCommand IspCommand::dataProgram(uint32_t address, uint8_t padding, const std::vector<uint8_t>& data)
{
    return { IspCommandType::DataProgram, makeAddressedPayload(address, padding, data) };
}

IspCommand IspCommand::dataRead(uint32_t address, uint16_t length)
{
    std::vector<uint8_t> payload;
    appendLittleEndian(payload, address);
    appendLittleEndian(payload, length);
    return { IspCommandType::DataRead, std::move(payload) };
}

IspCommand IspCommand::fromRaw(const std::vector<uint8_t>& raw)
{
    if(raw.size() < HeaderSize) {
        throw IspError(ErrorKind::ProtocolDecodeError, "command frame of " + std::to_string(raw.size()) + " bytes",
                       IspError::ErrorCode::TruncatedFrame);
    }
    const auto type{ parseIspCommandType(raw[0]) };
    if(!type) {
        throw IspError(ErrorKind::ProtocolDecodeError, "kind " + toHexString(raw[0]),
                       IspError::ErrorCode::UnknownKind);
    }
    const size_t payloadSize{ raw[1] };
    if(raw.size() < HeaderSize + payloadSize) {
        throw IspError(ErrorKind::ProtocolDecodeError, "declared " + std::to_string(payloadSize) + " payload bytes",
                       IspError::ErrorCode::TruncatedFrame);
    }
    return { *type, std::vector<uint8_t>(raw.cbegin() + HeaderSize, raw.cbegin() + HeaderSize + payloadSize) };
}

IspCommand::IspCommand(IspCommandType type, std::vector<uint8_t>&& payload)
    : _type{ type }
    , _payload{ std::move(payload) }
{
}

IspCommandType IspCommand::getType() const
{
    return _type;
}

const std::vector<uint8_t>& IspCommand::getPayload() const
{
    return _payload;
}

std::vector<uint8_t> IspCommand::toRaw() const
{
    if(_payload.size() > MaxPayloadSize) {
        throw IspError(ErrorKind::ProtocolDecodeError,
                       toString(_type) + " payload of " + std::to_string(_payload.size()) + " bytes",
                       IspError::ErrorCode::PayloadTooLong);
    }
    std::vector<uint8_t> raw;
    raw.reserve(HeaderSize + _payload.size());
    raw.push_back(static_cast<uint8_t>(_type));
    raw.push_back(static_cast<uint8_t>(_payload.size()));
    raw.push_back(0x00);
    std::copy(_payload.cbegin(), _payload.cend(), std::back_inserter(raw));
    return raw;
}

} // namespace common
