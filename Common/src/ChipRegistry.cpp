#include "common/ChipRegistry.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace common {

namespace {

std::vector<ConfigRegister> getCH32ConfigRegisters()
{
    return {
        { "RDPR_USER", 0x00, 0x00FF5AA5 },
        { "DATA", 0x04, 0x00FF00FF },
        { "WPR", 0x08, 0xFFFFFFFF },
    };
}

ChipInfo makeChip(const std::string& name, uint8_t chipId, uint8_t deviceType, uint32_t flashKiB,
                  uint32_t eepromKiB, ChipFamily family)
{
    ChipInfo chip{ name, chipId, deviceType, flashKiB * 1024, eepromKiB * 1024, family, {} };
    if (chip.supportsCodeFlashProtect()) {
        chip.configRegisters = getCH32ConfigRegisters();
    }
    return chip;
}

}

ChipRegistry::ChipRegistry(std::vector<ChipInfo>&& chips)
{
    for (auto& chip : chips) {
        const auto key{ std::make_pair(chip.chipId, chip.deviceType) };
        if (!_chips.emplace(key, std::move(chip)).second) {
            std::stringstream stream;
            stream << "Duplicate chip definition for key 0x" << std::hex << std::uppercase << std::setfill('0')
                   << std::setw(2) << static_cast<int>(key.first)
                   << std::setw(2) << static_cast<int>(key.second);
            throw std::invalid_argument(stream.str());
        }
    }
}

ChipInfo ChipRegistry::lookup(uint8_t chipId, uint8_t deviceType) const
{
    const auto it{ _chips.find(std::make_pair(chipId, deviceType)) };
    if (it != _chips.cend()) {
        return it->second;
    }
    return makeUnknownChipInfo(chipId, deviceType);
}

bool ChipRegistry::isSupported(uint8_t chipId, uint8_t deviceType) const
{
    return _chips.find(std::make_pair(chipId, deviceType)) != _chips.cend();
}

std::vector<ChipInfo> ChipRegistry::getChips() const
{
    std::vector<ChipInfo> result;
    result.reserve(_chips.size());
    for (const auto& item : _chips) {
        result.push_back(item.second);
    }
    return result;
}

ChipInfo makeUnknownChipInfo(uint8_t chipId, uint8_t deviceType)
{
    std::stringstream stream;
    stream << "Unknown[0x" << std::hex << std::uppercase << std::setfill('0')
           << std::setw(2) << static_cast<int>(chipId)
           << std::setw(2) << static_cast<int>(deviceType) << "]";
    return { stream.str(), chipId, deviceType, ChipRegistry::UnknownFlashSize, 0, ChipFamily::Unknown, {} };
}

std::vector<ChipInfo> getBuiltinChips()
{
    return {
        makeChip("CH32V307", 0x70, 0x17, 256, 0, ChipFamily::CH32V),
        makeChip("CH32V103", 0x30, 0x30, 64, 0, ChipFamily::CH32V),
        makeChip("CH32V203", 0x30, 0x19, 64, 0, ChipFamily::CH32V),
        makeChip("CH32V003", 0x30, 0x21, 16, 0, ChipFamily::CH32V003),
        makeChip("CH32F103", 0x10, 0x30, 128, 0, ChipFamily::CH32F),
        makeChip("CH32X035", 0x50, 0x23, 62, 0, ChipFamily::CH32X035),
        makeChip("CH582", 0x82, 0x82, 448, 32, ChipFamily::CH582),
        makeChip("CH549", 0x49, 0x11, 62, 1, ChipFamily::CH549),
        makeChip("CH552", 0x52, 0x11, 16, 1, ChipFamily::CH552),
        makeChip("CH573", 0x73, 0x13, 448, 32, ChipFamily::CH573),
        makeChip("CH579", 0x79, 0x13, 250, 2, ChipFamily::CH579),
        makeChip("CH559", 0x59, 0x22, 62, 1, ChipFamily::CH559),
        makeChip("CH592", 0x92, 0x13, 250, 32, ChipFamily::CH592),
    };
}

const ChipRegistry& getDefaultChipRegistry()
{
    static const ChipRegistry registry{ getBuiltinChips() };
    return registry;
}

} // namespace common
