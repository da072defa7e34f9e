#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace common {

// Flat flash image starting at the lowest address found in the file.
// Supported formats are raw binary (.bin) and Intel HEX (.hex).
std::vector<uint8_t> loadFirmware(const std::string& path, std::istream& input);
std::vector<uint8_t> loadFirmware(const std::string& path);

} // namespace common
