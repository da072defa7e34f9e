#pragma once

#include <common/ChipRegistry.hpp>
#include <common/ProtocolSettings.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

namespace common {
class ITransport;
} // namespace common

namespace flasher {

class IspFlasher;

// Maps opaque integer handles to open device sessions. Sessions on distinct
// transports may be driven from different threads.
class SessionManager {
public:
    explicit SessionManager(const common::ChipRegistry& registry = common::getDefaultChipRegistry(),
                            const common::ProtocolSettings& settings = {});

    // Identifies the device behind the transport and returns its handle.
    int open(std::shared_ptr<common::ITransport> transport, uint16_t vendorId, uint16_t productId);
    bool close(int handle);
    std::shared_ptr<IspFlasher> get(int handle) const;

    size_t size() const;

private:
    const common::ChipRegistry& _registry;
    const common::ProtocolSettings _settings;
    mutable std::mutex _mutex;
    int _nextHandle;
    std::map<int, std::shared_ptr<IspFlasher>> _sessions;
};

} // namespace flasher
