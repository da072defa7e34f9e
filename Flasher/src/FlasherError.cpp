#include "flasher/FlasherError.hpp"

#include <iomanip>
#include <sstream>

namespace flasher {

namespace {

std::string makeMessage(FlasherState state, const std::optional<uint32_t>& address, const std::string& message)
{
    std::stringstream stream;
    stream << toString(state);
    if(address) {
        stream << " at 0x" << std::hex << std::setfill('0') << std::setw(8) << *address;
    }
    if(!message.empty()) {
        stream << ", " << message;
    }
    return stream.str();
}

}

FlasherError::FlasherError(FlasherState state, const common::IspError& cause, std::optional<uint32_t> address)
    : common::IspError{ cause.getKind(), makeMessage(state, address, cause.getMessage()), cause.getErrorCode(),
                        cause.getStatus() }
    , _state{ state }
    , _address{ address }
{
}

FlasherError::FlasherError(FlasherState state, common::ErrorKind kind, const std::string& message,
                           std::optional<uint32_t> address, uint8_t status)
    : common::IspError{ kind, makeMessage(state, address, message), ErrorCode::Generic, status }
    , _state{ state }
    , _address{ address }
{
}

FlasherState FlasherError::getState() const noexcept
{
    return _state;
}

const std::optional<uint32_t>& FlasherError::getAddress() const noexcept
{
    return _address;
}

} // namespace flasher
