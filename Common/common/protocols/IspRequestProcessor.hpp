#pragma once

#include "IspCommand.hpp"
#include "IspResponse.hpp"

#include "common/ProtocolSettings.hpp"

#include <chrono>
#include <mutex>

namespace common {

class ITransport;

class IspRequestProcessor {
public:
    IspRequestProcessor(ITransport& transport, const ProtocolSettings& settings);

    // Exactly one round trip, no retries.
    IspResponse transfer(const IspCommand& command, std::chrono::milliseconds timeout) const;
    IspResponse transfer(const IspCommand& command) const;

    const ProtocolSettings& getSettings() const;

private:
    IspResponse transferImpl(const IspCommand& command, std::chrono::milliseconds timeout) const;

private:
    ITransport& _transport;
    const ProtocolSettings _settings;
    mutable std::mutex _mutex;
};

} // namespace common
