#pragma once

#include "ChipFamily.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace common {

struct ConfigRegister {
    std::string name;
    uint32_t offset{ 0 };
    std::optional<uint32_t> reset;
};

struct ChipInfo {
    std::string name;
    uint8_t chipId{ 0 };
    uint8_t deviceType{ 0 };
    uint32_t flashSize{ 0 };
    uint32_t eepromSize{ 0 };
    ChipFamily family{ ChipFamily::Unknown };
    std::vector<ConfigRegister> configRegisters;

    bool supportsCodeFlashProtect() const;
    bool supportsEncryption() const;
    uint32_t minEraseSectorNumber() const;
    uint32_t sectorSize() const;
    size_t uidSize() const;

    // NAME[0xIIDD]
    std::string toString() const;
};

} // namespace common
