#pragma once

#include <string>

namespace common {

enum class ChipFamily
{
    CH32V,
    CH32V003,
    CH32F,
    CH32X035,
    CH549,
    CH552,
    CH559,
    CH573,
    CH579,
    CH582,
    CH592,
    Unknown
};

ChipFamily parseChipFamily(const std::string& value);
std::string toString(ChipFamily family);

}
