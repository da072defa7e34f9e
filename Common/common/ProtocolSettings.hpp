#pragma once

#include <chrono>

namespace common {

// Timing and tolerance knobs of the ISP exchange. The grace period and the
// key checksum tolerance are empirical values, keep them adjustable.
struct ProtocolSettings {
    std::chrono::microseconds gracePeriod{ 100 };
    std::chrono::milliseconds defaultTimeout{ 1000 };
    std::chrono::milliseconds eraseTimeout{ 5000 };
    std::chrono::milliseconds programTimeout{ 300 };
    std::chrono::milliseconds dataEraseTimeout{ 1000 };
    bool strictKeyChecksum{ false };
};

} // namespace common
