#pragma once

#include "ChipInfo.hpp"

#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace common {

class ChipRegistry {
public:
    static constexpr uint32_t UnknownFlashSize = 64 * 1024;

    explicit ChipRegistry(std::vector<ChipInfo>&& chips);

    // Never fails: unmatched keys yield a synthesized Unknown descriptor.
    ChipInfo lookup(uint8_t chipId, uint8_t deviceType) const;
    bool isSupported(uint8_t chipId, uint8_t deviceType) const;

    std::vector<ChipInfo> getChips() const;

private:
    std::map<std::pair<uint8_t, uint8_t>, ChipInfo> _chips;
};

ChipInfo makeUnknownChipInfo(uint8_t chipId, uint8_t deviceType);

std::vector<ChipInfo> getBuiltinChips();

// Built-in table, constructed once and read-only afterwards.
const ChipRegistry& getDefaultChipRegistry();

} // namespace common
