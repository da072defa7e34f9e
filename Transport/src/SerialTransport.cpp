#include "transport/SerialTransport.hpp"

#include <common/protocols/IspError.hpp>
#include <common/Util.hpp>

#include <easylogging++.h>

#include <cerrno>
#include <cstring>
#include <iterator>
#include <stdexcept>

#include <fcntl.h>
#include <sys/select.h>
#include <unistd.h>

namespace transport {

namespace {

constexpr uint8_t REQUEST_MAGIC[] = { 0x57, 0xAB };
constexpr uint8_t RESPONSE_MAGIC[] = { 0x55, 0xAA };
constexpr size_t MAGIC_SIZE = 2;
constexpr size_t RESPONSE_HEADER_SIZE = 4;
constexpr size_t CHECKSUM_SIZE = 1;

speed_t toSpeed(unsigned baudrate)
{
    switch(baudrate) {
    case 9600:
        return B9600;
    case 19200:
        return B19200;
    case 38400:
        return B38400;
    case 57600:
        return B57600;
    case 115200:
        return B115200;
    case 230400:
        return B230400;
    case 460800:
        return B460800;
    case 921600:
        return B921600;
    case 1000000:
        return B1000000;
    case 2000000:
        return B2000000;
    }
    throw std::invalid_argument("Unsupported baudrate " + std::to_string(baudrate));
}

std::string getErrorString()
{
    return std::strerror(errno);
}

}

std::vector<uint8_t> SerialTransport::encodeFrame(const std::vector<uint8_t>& frame)
{
    std::vector<uint8_t> result(std::begin(REQUEST_MAGIC), std::end(REQUEST_MAGIC));
    result.insert(result.end(), frame.cbegin(), frame.cend());
    result.push_back(common::wrappingSum(frame));
    return result;
}

std::vector<uint8_t> SerialTransport::decodeFrame(const std::vector<uint8_t>& data)
{
    if(data.size() < MAGIC_SIZE + RESPONSE_HEADER_SIZE + CHECKSUM_SIZE) {
        throw common::IspError(common::ErrorKind::ProtocolDecodeError,
                               "serial response of " + std::to_string(data.size()) + " bytes",
                               common::IspError::ErrorCode::TruncatedFrame);
    }
    if(data[0] != RESPONSE_MAGIC[0] || data[1] != RESPONSE_MAGIC[1]) {
        throw common::IspError(common::ErrorKind::ProtocolDecodeError,
                               "serial response starts with " + common::toHexString({ data[0], data[1] }),
                               common::IspError::ErrorCode::BadFraming);
    }
    std::vector<uint8_t> frame(data.cbegin() + MAGIC_SIZE, data.cend() - CHECKSUM_SIZE);
    const auto checksum{ common::wrappingSum(frame) };
    if(checksum != data.back()) {
        throw common::IspError(common::ErrorKind::ProtocolDecodeError,
                               "expected " + common::toHexString(checksum) + ", got " + common::toHexString(data.back()),
                               common::IspError::ErrorCode::BadChecksum);
    }
    return frame;
}

SerialTransport::SerialTransport(const std::string& portName, unsigned baudrate)
    : _portName{ portName }
    , _fd{ -1 }
    , _oldTio{}
{
    const auto speed{ toSpeed(baudrate) };
    _fd = ::open(_portName.c_str(), O_RDWR | O_NOCTTY);
    if(_fd < 0) {
        throw common::IspError(common::ErrorKind::TransportFailure, "open(" + _portName + "): " + getErrorString());
    }
    tcgetattr(_fd, &_oldTio);

    termios newTio{};
    cfmakeraw(&newTio);
    newTio.c_cflag |= CLOCAL | CREAD;
    newTio.c_cc[VTIME] = 0;
    newTio.c_cc[VMIN] = 0;
    cfsetispeed(&newTio, speed);
    cfsetospeed(&newTio, speed);

    tcflush(_fd, TCIOFLUSH);
    if(tcsetattr(_fd, TCSANOW, &newTio) != 0) {
        const auto message{ "tcsetattr(" + _portName + "): " + getErrorString() };
        ::close(_fd);
        throw common::IspError(common::ErrorKind::TransportFailure, message);
    }
    LOG(INFO) << "Opened " << _portName << " at " << baudrate << " baud";
}

SerialTransport::~SerialTransport()
{
    tcsetattr(_fd, TCSANOW, &_oldTio);
    ::close(_fd);
}

size_t SerialTransport::send(const std::vector<uint8_t>& data)
{
    const auto packet{ encodeFrame(data) };
    size_t written{ 0 };
    while(written < packet.size()) {
        const auto result{ ::write(_fd, packet.data() + written, packet.size() - written) };
        if(result < 0) {
            if(errno == EINTR) {
                continue;
            }
            throw common::IspError(common::ErrorKind::TransportFailure, "write(" + _portName + "): " + getErrorString());
        }
        written += static_cast<size_t>(result);
    }
    tcdrain(_fd);
    // Report the frame as sent, the framing bytes are ours.
    return data.size();
}

std::vector<uint8_t> SerialTransport::receive(std::chrono::milliseconds timeout)
{
    const auto deadline{ std::chrono::steady_clock::now() + timeout };
    std::vector<uint8_t> data(MAGIC_SIZE + RESPONSE_HEADER_SIZE);

    size_t received{ 0 };
    while(received < data.size()) {
        const auto count{ readAvailable(data.data() + received, data.size() - received, deadline) };
        if(count == 0) {
            break;
        }
        received += count;
    }
    if(received == 0) {
        return {};
    }
    if(received < data.size()) {
        throw common::IspError(common::ErrorKind::ProtocolDecodeError,
                               "serial response header of " + std::to_string(received) + " bytes",
                               common::IspError::ErrorCode::TruncatedFrame);
    }

    const size_t payloadSize{ data[MAGIC_SIZE + 1] };
    data.resize(data.size() + payloadSize + CHECKSUM_SIZE);
    while(received < data.size()) {
        const auto count{ readAvailable(data.data() + received, data.size() - received, deadline) };
        if(count == 0) {
            throw common::IspError(common::ErrorKind::ProtocolDecodeError,
                                   "serial response of " + std::to_string(received) + " of "
                                       + std::to_string(data.size()) + " bytes",
                                   common::IspError::ErrorCode::TruncatedFrame);
        }
        received += count;
    }
    return decodeFrame(data);
}

size_t SerialTransport::readAvailable(uint8_t* buffer, size_t size, std::chrono::steady_clock::time_point deadline) const
{
    while(true) {
        const auto now{ std::chrono::steady_clock::now() };
        if(now >= deadline) {
            return 0;
        }
        const auto remaining{ std::chrono::duration_cast<std::chrono::microseconds>(deadline - now) };
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(remaining.count() / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(remaining.count() % 1000000);

        fd_set readSet;
        FD_ZERO(&readSet);
        FD_SET(_fd, &readSet);
        const auto ready{ ::select(_fd + 1, &readSet, nullptr, nullptr, &tv) };
        if(ready < 0) {
            if(errno == EINTR) {
                continue;
            }
            throw common::IspError(common::ErrorKind::TransportFailure, "select(" + _portName + "): " + getErrorString());
        }
        if(ready == 0) {
            return 0;
        }
        const auto result{ ::read(_fd, buffer, size) };
        if(result < 0) {
            if(errno == EINTR || errno == EAGAIN) {
                continue;
            }
            throw common::IspError(common::ErrorKind::TransportFailure, "read(" + _portName + "): " + getErrorString());
        }
        if(result > 0) {
            return static_cast<size_t>(result);
        }
    }
}

} // namespace transport
