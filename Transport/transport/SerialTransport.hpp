#pragma once

#include <common/ITransport.hpp>

#include <cstddef>
#include <string>

#include <termios.h>

namespace transport {

// WCH bootloader over a UART. Commands travel as 57 AB <frame> <sum>,
// responses as 55 AA <frame> <sum>, sum being the wrapping sum of <frame>.
class SerialTransport: public common::ITransport {
public:
    static constexpr unsigned DEFAULT_BAUDRATE = 115200;

    static std::vector<uint8_t> encodeFrame(const std::vector<uint8_t>& frame);
    // Strips the framing from one complete response, verifying the checksum.
    static std::vector<uint8_t> decodeFrame(const std::vector<uint8_t>& data);

    explicit SerialTransport(const std::string& portName, unsigned baudrate = DEFAULT_BAUDRATE);
    ~SerialTransport();

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    size_t send(const std::vector<uint8_t>& data) override;
    std::vector<uint8_t> receive(std::chrono::milliseconds timeout) override;

private:
    size_t readAvailable(uint8_t* buffer, size_t size, std::chrono::steady_clock::time_point deadline) const;

private:
    const std::string _portName;
    int _fd;
    termios _oldTio;
};

} // namespace transport
