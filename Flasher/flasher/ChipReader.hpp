#pragma once

#include "FlashSession.hpp"

#include <common/protocols/IspResponse.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace common {
class ChipRegistry;
class IspRequestProcessor;
} // namespace common

namespace flasher {

class ChipReader {
public:
    static constexpr size_t CONFIG_OFFSET = 2;
    static constexpr size_t CONFIG_SIZE = 12;
    static constexpr size_t BTVER_OFFSET = 14;
    static constexpr size_t UID_OFFSET = 18;
    static constexpr uint8_t RDPR_UNPROTECTED = 0xA5;

    ChipReader(const common::IspRequestProcessor& processor, const common::ChipRegistry& registry);

    std::pair<uint8_t, uint8_t> identify() const;
    common::IspResponse readConfig(uint32_t mask) const;
    void applyConfig(const common::IspResponse& response, FlashSession& session) const;
    void unprotect(FlashSession& session) const;

    FlashSession open() const;

    static std::string describe(const FlashSession& session);

private:
    const common::IspRequestProcessor& _processor;
    const common::ChipRegistry& _registry;
};

} // namespace flasher
