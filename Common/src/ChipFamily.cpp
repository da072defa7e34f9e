#include "common/ChipFamily.hpp"

#include "common/Util.hpp"
#include <stdexcept>

namespace common {

ChipFamily parseChipFamily(const std::string& value)
{
    const auto lowered{ toLower(value) };
    if (lowered == "ch32v")
        return ChipFamily::CH32V;
    else if (lowered == "ch32v003")
        return ChipFamily::CH32V003;
    else if (lowered == "ch32f")
        return ChipFamily::CH32F;
    else if (lowered == "ch32x035")
        return ChipFamily::CH32X035;
    else if (lowered == "ch549")
        return ChipFamily::CH549;
    else if (lowered == "ch552")
        return ChipFamily::CH552;
    else if (lowered == "ch559")
        return ChipFamily::CH559;
    else if (lowered == "ch573")
        return ChipFamily::CH573;
    else if (lowered == "ch579")
        return ChipFamily::CH579;
    else if (lowered == "ch582")
        return ChipFamily::CH582;
    else if (lowered == "ch592")
        return ChipFamily::CH592;
    else if (lowered == "unknown")
        return ChipFamily::Unknown;
    throw std::runtime_error("Unknown chip family " + value);
}

std::string toString(ChipFamily family)
{
    switch (family) {
    case ChipFamily::CH32V:
        return "CH32V";
    case ChipFamily::CH32V003:
        return "CH32V003";
    case ChipFamily::CH32F:
        return "CH32F";
    case ChipFamily::CH32X035:
        return "CH32X035";
    case ChipFamily::CH549:
        return "CH549";
    case ChipFamily::CH552:
        return "CH552";
    case ChipFamily::CH559:
        return "CH559";
    case ChipFamily::CH573:
        return "CH573";
    case ChipFamily::CH579:
        return "CH579";
    case ChipFamily::CH582:
        return "CH582";
    case ChipFamily::CH592:
        return "CH592";
    case ChipFamily::Unknown:
        return "Unknown";
    }
    return {};
}

} // namespace common
