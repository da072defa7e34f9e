#include "common/FirmwareLoader.hpp"

#include "common/protocols/IspError.hpp"
#include "common/Util.hpp"

#include <easylogging++.h>
#include <intelhex.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace common {

namespace {

constexpr uint8_t ERASED_BYTE = 0xFF;

bool hasExtension(const std::string& path, const std::string& extension)
{
    const auto lowerPath{ toLower(path) };
    return lowerPath.size() >= extension.size()
        && lowerPath.compare(lowerPath.size() - extension.size(), extension.size(), extension) == 0;
}

std::vector<uint8_t> loadBinary(std::istream& input)
{
    return { std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>() };
}

std::vector<uint8_t> loadHex(std::istream& input)
{
    intelhex::hex_data hexData;
    hexData.read(input);
    hexData.compact();
    if(hexData.begin() == hexData.end()) {
        return {};
    }

    const auto startAddress{ hexData.begin()->first };
    size_t endAddress{ startAddress };
    for(const auto& block: hexData) {
        endAddress = std::max<size_t>(endAddress, block.first + block.second.size());
    }

    std::vector<uint8_t> result(endAddress - startAddress, ERASED_BYTE);
    for(const auto& block: hexData) {
        std::copy(block.second.cbegin(), block.second.cend(), result.begin() + (block.first - startAddress));
    }
    LOG(INFO) << "Loaded hex image at 0x" << std::hex << startAddress << std::dec << ", " << result.size()
              << " bytes";
    return result;
}

}

std::vector<uint8_t> loadFirmware(const std::string& path, std::istream& input)
{
    if(hasExtension(path, ".hex")) {
        return loadHex(input);
    }
    if(hasExtension(path, ".bin")) {
        return loadBinary(input);
    }
    throw IspError(ErrorKind::UnsupportedFeature, "firmware format of " + path);
}

std::vector<uint8_t> loadFirmware(const std::string& path)
{
    std::ifstream input(path, std::ios_base::binary);
    if(!input) {
        throw std::runtime_error("Can't open firmware file " + path);
    }
    return loadFirmware(path, input);
}

} // namespace common
