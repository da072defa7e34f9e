#include "common/ChipInfo.hpp"

#include <iomanip>
#include <sstream>

namespace common {

bool ChipInfo::supportsCodeFlashProtect() const
{
    switch (family) {
    case ChipFamily::CH32V:
    case ChipFamily::CH32V003:
    case ChipFamily::CH32F:
    case ChipFamily::CH32X035:
        return true;
    default:
        break;
    }
    return false;
}

bool ChipInfo::supportsEncryption() const
{
    switch (family) {
    case ChipFamily::CH549:
    case ChipFamily::CH552:
    case ChipFamily::CH559:
    case ChipFamily::Unknown:
        return false;
    default:
        break;
    }
    return true;
}

uint32_t ChipInfo::minEraseSectorNumber() const
{
    return 1;
}

uint32_t ChipInfo::sectorSize() const
{
    return 1024;
}

size_t ChipInfo::uidSize() const
{
    switch (family) {
    case ChipFamily::CH549:
    case ChipFamily::CH552:
    case ChipFamily::CH559:
        return 4;
    default:
        break;
    }
    return 8;
}

std::string ChipInfo::toString() const
{
    if (family == ChipFamily::Unknown) {
        // Synthesized names already carry the identity key.
        return name;
    }
    std::stringstream stream;
    stream << name << "[0x" << std::hex << std::uppercase << std::setfill('0')
           << std::setw(2) << static_cast<int>(chipId)
           << std::setw(2) << static_cast<int>(deviceType) << "]";
    return stream.str();
}

} // namespace common
