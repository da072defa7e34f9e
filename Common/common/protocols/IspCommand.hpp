#pragma once

#include "IspCommandType.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace common {

// Config register masks used by ReadConfig/WriteConfig.
constexpr uint32_t CFG_MASK_RDPR_USER_DATA_WPR = 0x07;
constexpr uint32_t CFG_MASK_ALL = 0x1F;

class IspCommand {
public:
    static constexpr size_t HeaderSize = 3;
    static constexpr size_t MaxPayloadSize = 0xFF;

    static IspCommand identify(uint8_t chipId, uint8_t deviceType);
    static IspCommand ispEnd(uint8_t reset);
    static IspCommand ispKey(std::vector<uint8_t>&& keySeed);
    static IspCommand erase(uint32_t sectors);
    static IspCommand program(uint32_t address, uint8_t padding, const std::vector<uint8_t>& data);
    static IspCommand verify(uint32_t address, uint8_t padding, const std::vector<uint8_t>& data);
    static IspCommand readConfig(uint32_t mask);
    static IspCommand writeConfig(uint32_t mask, const std::vector<uint8_t>& data);
    static IspCommand dataErase(uint16_t sectors);
    static IspCommand dataProgram(uint32_t address, uint8_t padding, const std::vector<uint8_t>& data);
    static IspCommand dataRead(uint32_t address, uint16_t length);

    // Inverse of toRaw(), decodes a command frame as a device would see it.
    static IspCommand fromRaw(const std::vector<uint8_t>& raw);

    IspCommand(IspCommandType type, std::vector<uint8_t>&& payload);

    IspCommandType getType() const;
    const std::vector<uint8_t>& getPayload() const;

    std::vector<uint8_t> toRaw() const;

private:
    IspCommandType _type;
    std::vector<uint8_t> _payload;
};

} // namespace common
