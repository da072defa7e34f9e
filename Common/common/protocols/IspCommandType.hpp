#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace common {

enum class IspCommandType : uint8_t {
    Identify = 0xA1,
    IspEnd = 0xA2,
    IspKey = 0xA3,
    Erase = 0xA4,
    Program = 0xA5,
    Verify = 0xA6,
    ReadConfig = 0xA7,
    WriteConfig = 0xA8,
    DataErase = 0xA9,
    DataProgram = 0xAA,
    DataRead = 0xAB
};

std::optional<IspCommandType> parseIspCommandType(uint8_t value);
std::string toString(IspCommandType type);

} // namespace common
