#pragma once

#include "IspCommandType.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace common {

class IspResponse {
public:
    static constexpr size_t HeaderSize = 4;

    static IspResponse fromRaw(const std::vector<uint8_t>& raw);

    IspCommandType getType() const;
    uint8_t getStatus() const;
    const std::vector<uint8_t>& getPayload() const;

    bool isOk() const;

    // Encodes the response the way a device does, for simulators and tests.
    std::vector<uint8_t> toRaw() const;

    IspResponse(IspCommandType type, uint8_t status, std::vector<uint8_t>&& payload);

private:
    IspCommandType _type;
    uint8_t _status;
    std::vector<uint8_t> _payload;
};

} // namespace common
