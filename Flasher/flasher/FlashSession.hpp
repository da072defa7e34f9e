#pragma once

#include <common/ChipInfo.hpp>

#include <array>
#include <cstdint>
#include <vector>

namespace flasher {

struct FlashSession {
    common::ChipInfo chip;
    std::vector<uint8_t> uid;
    std::array<uint8_t, 4> bootloaderVersion{};
    bool codeFlashProtected{ false };
    // Raw RDPR/USER, DATA and WPR bytes as last read.
    std::vector<uint8_t> configData;
};

} // namespace flasher
