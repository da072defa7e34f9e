#pragma once

#include "ChipInfo.hpp"
#include "ProtocolSettings.hpp"

#include <istream>
#include <string>
#include <vector>

namespace common {

struct ConfigurationInfo {
    std::vector<ChipInfo> chips;
    ProtocolSettings settings;
};

ConfigurationInfo loadConfiguration(std::istream& input);
ConfigurationInfo loadConfiguration(const std::string& input);

} // namespace common
