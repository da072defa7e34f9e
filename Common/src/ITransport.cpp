#include "common/ITransport.hpp"

namespace common {

bool isSupportedDevice(uint16_t vendorId, uint16_t productId)
{
    return (vendorId == WCH_VENDOR_ID || vendorId == QINHENG_VENDOR_ID) && productId == WCH_ISP_PRODUCT_ID;
}

} // namespace common
