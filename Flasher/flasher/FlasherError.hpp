#pragma once

#include "FlasherState.hpp"

#include <common/protocols/IspError.hpp>

#include <optional>

namespace flasher {

// Failure of one step of the flashing sequence. The kind and detail code
// come from the underlying protocol error.
class FlasherError: public common::IspError {
public:
    FlasherError(FlasherState state, const common::IspError& cause, std::optional<uint32_t> address = std::nullopt);
    FlasherError(FlasherState state, common::ErrorKind kind, const std::string& message,
                 std::optional<uint32_t> address = std::nullopt, uint8_t status = 0);

    FlasherState getState() const noexcept;
    const std::optional<uint32_t>& getAddress() const noexcept;

private:
    FlasherState _state;
    std::optional<uint32_t> _address;
};

} // namespace flasher
