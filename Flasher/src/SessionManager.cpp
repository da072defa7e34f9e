#include "flasher/SessionManager.hpp"

#include "flasher/IspFlasher.hpp"

#include <common/ITransport.hpp>
#include <common/protocols/IspError.hpp>

#include <easylogging++.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace flasher {

SessionManager::SessionManager(const common::ChipRegistry& registry, const common::ProtocolSettings& settings)
    : _registry{ registry }
    , _settings{ settings }
    , _nextHandle{ 1 }
{
}

int SessionManager::open(std::shared_ptr<common::ITransport> transport, uint16_t vendorId, uint16_t productId)
{
    if(!common::isSupportedDevice(vendorId, productId)) {
        std::stringstream stream;
        stream << std::hex << std::setfill('0') << std::setw(4) << vendorId << ":" << std::setw(4) << productId;
        throw common::IspError(common::ErrorKind::UnsupportedFeature, "USB device " + stream.str());
    }
    if(!transport) {
        throw std::invalid_argument("Transport is required to open a session");
    }

    // Identification talks to the device, keep it outside the lock.
    auto flasher{ std::make_shared<IspFlasher>(std::move(transport), _registry, _settings) };

    std::unique_lock<std::mutex> lock{ _mutex };
    const auto handle{ _nextHandle++ };
    _sessions.emplace(handle, std::move(flasher));
    LOG(INFO) << "Opened session " << handle;
    return handle;
}

bool SessionManager::close(int handle)
{
    std::unique_lock<std::mutex> lock{ _mutex };
    const auto erased{ _sessions.erase(handle) > 0 };
    if(erased) {
        LOG(INFO) << "Closed session " << handle;
    }
    return erased;
}

std::shared_ptr<IspFlasher> SessionManager::get(int handle) const
{
    std::unique_lock<std::mutex> lock{ _mutex };
    const auto it{ _sessions.find(handle) };
    if(it == _sessions.cend()) {
        return {};
    }
    return it->second;
}

size_t SessionManager::size() const
{
    std::unique_lock<std::mutex> lock{ _mutex };
    return _sessions.size();
}

} // namespace flasher
