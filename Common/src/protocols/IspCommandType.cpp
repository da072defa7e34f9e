#include "common/protocols/IspCommandType.hpp"

namespace common {

std::optional<IspCommandType> parseIspCommandType(uint8_t value)
{
    switch(value) {
    case 0xA1:
        return IspCommandType::Identify;
    case 0xA2:
        return IspCommandType::IspEnd;
    case 0xA3:
        return IspCommandType::IspKey;
    case 0xA4:
        return IspCommandType::Erase;
    case 0xA5:
        return IspCommandType::Program;
    case 0xA6:
        return IspCommandType::Verify;
    case 0xA7:
        return IspCommandType::ReadConfig;
    case 0xA8:
        return IspCommandType::WriteConfig;
    case 0xA9:
        return IspCommandType::DataErase;
    case 0xAA:
        return IspCommandType::DataProgram;
    case 0xAB:
        return IspCommandType::DataRead;
    }
    return std::nullopt;
}

std::string toString(IspCommandType type)
{
    switch(type) {
    case IspCommandType::Identify:
        return "Identify";
    case IspCommandType::IspEnd:
        return "IspEnd";
    case IspCommandType::IspKey:
        return "IspKey";
    case IspCommandType::Erase:
        return "Erase";
    case IspCommandType::Program:
        return "Program";
    case IspCommandType::Verify:
        return "Verify";
    case IspCommandType::ReadConfig:
        return "ReadConfig";
    case IspCommandType::WriteConfig:
        return "WriteConfig";
    case IspCommandType::DataErase:
        return "DataErase";
    case IspCommandType::DataProgram:
        return "DataProgram";
    case IspCommandType::DataRead:
        return "DataRead";
    }
    return {};
}

} // namespace common
