#include "common/ConfigurationInfo.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace common {

namespace {

uint8_t parseHexByte(const YAML::Node& node)
{
    const auto value{ std::stoul(node.as<std::string>(), nullptr, 16) };
    if (value > 0xFF) {
        throw std::runtime_error("Value " + node.as<std::string>() + " doesn't fit in one byte");
    }
    return static_cast<uint8_t>(value);
}

ConfigRegister processRegisterNode(const YAML::Node& node)
{
    ConfigRegister reg;
    reg.name = node["Name"].as<std::string>();
    reg.offset = node["Offset"].as<uint32_t>();
    const auto& reset = node["Reset"];
    if (reset.IsDefined()) {
        reg.reset = static_cast<uint32_t>(std::stoul(reset.as<std::string>(), nullptr, 16));
    }
    return reg;
}

ChipInfo processChipNode(const YAML::Node& node)
{
    ChipInfo chip;
    chip.name = node["Name"].as<std::string>();
    chip.chipId = parseHexByte(node["ChipId"]);
    chip.deviceType = parseHexByte(node["DeviceType"]);
    chip.family = parseChipFamily(node["Family"].as<std::string>("Unknown"));
    chip.flashSize = node["FlashSize"].as<uint32_t>();
    chip.eepromSize = node["EepromSize"].as<uint32_t>(0);
    const auto& registers = node["ConfigRegisters"];
    if (registers.IsDefined()) {
        for (const auto& reg : registers) {
            chip.configRegisters.emplace_back(processRegisterNode(reg));
        }
    }
    return chip;
}

ProtocolSettings processSettingsNode(const YAML::Node& node)
{
    ProtocolSettings settings;
    if (!node.IsDefined()) {
        return settings;
    }
    settings.gracePeriod = std::chrono::microseconds{ node["GracePeriodUs"].as<long>(settings.gracePeriod.count()) };
    settings.defaultTimeout = std::chrono::milliseconds{ node["DefaultTimeoutMs"].as<long>(settings.defaultTimeout.count()) };
    settings.eraseTimeout = std::chrono::milliseconds{ node["EraseTimeoutMs"].as<long>(settings.eraseTimeout.count()) };
    settings.programTimeout = std::chrono::milliseconds{ node["ProgramTimeoutMs"].as<long>(settings.programTimeout.count()) };
    settings.dataEraseTimeout = std::chrono::milliseconds{ node["DataEraseTimeoutMs"].as<long>(settings.dataEraseTimeout.count()) };
    settings.strictKeyChecksum = node["StrictKeyChecksum"].as<bool>(settings.strictKeyChecksum);
    return settings;
}

ConfigurationInfo loadConfigurationImpl(const YAML::Node& node)
{
    ConfigurationInfo result;
    const auto& chipNodes = node["Chips"];
    if (chipNodes.IsDefined()) {
        for (const auto& chipNode : chipNodes) {
            result.chips.emplace_back(processChipNode(chipNode));
        }
    }
    result.settings = processSettingsNode(node["Settings"]);
    return result;
}

}

ConfigurationInfo loadConfiguration(std::istream& input)
{
    return loadConfigurationImpl(YAML::Load(input));
}

ConfigurationInfo loadConfiguration(const std::string& input)
{
    return loadConfigurationImpl(YAML::Load(input));
}

} // namespace common
