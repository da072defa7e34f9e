#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace common {

constexpr uint16_t WCH_VENDOR_ID = 0x4348;
constexpr uint16_t QINHENG_VENDOR_ID = 0x1A86;
constexpr uint16_t WCH_ISP_PRODUCT_ID = 0x55E0;

// Half-duplex byte link to a device in ISP mode. One call to send() carries
// exactly one encoded command, one call to receive() yields one response.
class ITransport {
public:
    virtual ~ITransport() = default;

    // Returns the number of bytes actually sent.
    virtual size_t send(const std::vector<uint8_t>& data) = 0;
    // Empty result means nothing arrived before the timeout.
    virtual std::vector<uint8_t> receive(std::chrono::milliseconds timeout) = 0;
};

bool isSupportedDevice(uint16_t vendorId, uint16_t productId);

} // namespace common
