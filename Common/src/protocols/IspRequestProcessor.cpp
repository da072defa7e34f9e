#include "common/protocols/IspRequestProcessor.hpp"

#include "common/protocols/IspError.hpp"
#include "common/ITransport.hpp"
#include "common/Util.hpp"

#include <easylogging++.h>

#include <string>
#include <thread>

namespace common {

IspRequestProcessor::IspRequestProcessor(ITransport& transport, const ProtocolSettings& settings)
    : _transport{ transport }
    , _settings{ settings }
{
}

IspResponse IspRequestProcessor::transfer(const IspCommand& command, std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock{ _mutex };
    try {
        return transferImpl(command, timeout);
    }
    catch(const IspError&) {
        throw;
    }
    catch(const std::exception& ex) {
        throw IspError(ErrorKind::TransportFailure, toString(command.getType()) + ": " + ex.what());
    }
}

IspResponse IspRequestProcessor::transfer(const IspCommand& command) const
{
    return transfer(command, _settings.defaultTimeout);
}

const ProtocolSettings& IspRequestProcessor::getSettings() const
{
    return _settings;
}

IspResponse IspRequestProcessor::transferImpl(const IspCommand& command, std::chrono::milliseconds timeout) const
{
    const auto frame{ command.toRaw() };
    LOG(DEBUG) << "=> " << toHexString(frame);
    const auto sent{ _transport.send(frame) };
    if(sent != frame.size()) {
        throw IspError(ErrorKind::TransportFailure,
                       toString(command.getType()) + " sent " + std::to_string(sent) + " of "
                           + std::to_string(frame.size()) + " bytes",
                       IspError::ErrorCode::IncompleteSend);
    }

    std::this_thread::sleep_for(_settings.gracePeriod);

    const auto raw{ _transport.receive(timeout) };
    if(raw.empty()) {
        throw IspError(ErrorKind::TransportFailure,
                       toString(command.getType()) + " within " + std::to_string(timeout.count()) + " ms",
                       IspError::ErrorCode::NoResponse);
    }
    LOG(DEBUG) << "<= " << toHexString(raw);

    auto response{ IspResponse::fromRaw(raw) };
    if(response.getType() != command.getType()) {
        throw IspError(ErrorKind::KindMismatch,
                       "expected " + toString(command.getType()) + ", got " + toString(response.getType()));
    }
    return response;
}

} // namespace common
