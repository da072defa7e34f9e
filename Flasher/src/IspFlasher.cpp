#include "flasher/IspFlasher.hpp"

#include "flasher/FlasherCallback.hpp"
#include "flasher/FlasherError.hpp"

#include <common/encryption/XOREncryptor.hpp>
#include <common/ITransport.hpp>
#include <common/protocols/IspError.hpp>
#include <common/Util.hpp>

#include <easylogging++.h>

#include <algorithm>

namespace flasher {

template<typename Callable>
auto IspFlasher::runStep(FlasherState failState, Callable&& callable) -> decltype(callable())
{
    try {
        return callable();
    }
    catch(const FlasherError& ex) {
        LOG(ERROR) << ex.what();
        notifyError(ex);
        throw;
    }
    catch(const common::IspError& ex) {
        LOG(ERROR) << ex.what();
        FlasherError error{ failState, ex };
        notifyError(error);
        throw error;
    }
}

uint32_t IspFlasher::sectorsNeeded(size_t imageSize, const common::ChipInfo& chip)
{
    const auto sectorSize{ chip.sectorSize() };
    const auto sectors{ static_cast<uint32_t>((imageSize + sectorSize - 1) / sectorSize) };
    return std::max(sectors, chip.minEraseSectorNumber());
}

uint16_t IspFlasher::eepromSectorsNeeded(const common::ChipInfo& chip)
{
    return static_cast<uint16_t>(std::max<uint32_t>(chip.eepromSize / 1024, 1));
}

IspFlasher::IspFlasher(std::shared_ptr<common::ITransport> transport, const common::ChipRegistry& registry,
                       const common::ProtocolSettings& settings)
    : _transport{ std::move(transport) }
    , _processor{ *_transport, settings }
    , _reader{ _processor, registry }
    , _session{}
    , _random{ std::random_device{}() }
    , _currentState{ FlasherState::Initial }
    , _maximumProgress{ 0 }
{
    _session = runStep(FlasherState::Identified, [this]() {
        return _reader.open();
    });
    setCurrentState(FlasherState::Identified);
    setCurrentState(FlasherState::ConfigRead);
}

IspFlasher::~IspFlasher() = default;

const FlashSession& IspFlasher::getSession() const
{
    return _session;
}

const common::ChipInfo& IspFlasher::getChip() const
{
    return _session.chip;
}

std::string IspFlasher::describe() const
{
    return ChipReader::describe(_session);
}

FlasherState IspFlasher::getCurrentState() const
{
    std::unique_lock<std::mutex> lock{ _mutex };
    return _currentState;
}

void IspFlasher::registerCallback(FlasherCallback& callback)
{
    std::unique_lock<std::mutex> lock{ _mutex };
    _callbacks.push_back(&callback);
}

void IspFlasher::unregisterCallback(FlasherCallback& callback)
{
    std::unique_lock<std::mutex> lock{ _mutex };
    _callbacks.erase(std::remove(_callbacks.begin(), _callbacks.end(), &callback), _callbacks.end());
}

void IspFlasher::flash(const std::vector<uint8_t>& firmware)
{
    LOG(INFO) << "Starting firmware flash, size " << firmware.size() << " bytes";
    if(_session.codeFlashProtected) {
        unprotect();
    }
    erase(sectorsNeeded(firmware.size(), _session.chip));
    setupKey();
    program(firmware);
    LOG(INFO) << "Firmware flash completed";
}

void IspFlasher::unprotect()
{
    LOG(INFO) << "Unprotecting code flash";
    runStep(FlasherState::Unprotect, [this]() {
        _reader.unprotect(_session);
    });
    setCurrentState(FlasherState::Unprotect);
}

void IspFlasher::erase(uint32_t sectors)
{
    LOG(INFO) << "Erasing " << sectors << " flash sectors";
    runStep(FlasherState::Erased, [this, sectors]() {
        transferChecked(common::IspCommand::erase(sectors), _processor.getSettings().eraseTimeout,
                        FlasherState::Erased);
    });
    setCurrentState(FlasherState::Erased);
}

void IspFlasher::eraseAll()
{
    erase(sectorsNeeded(_session.chip.flashSize, _session.chip));
}

void IspFlasher::setupKey()
{
    LOG(DEBUG) << "Setting up ISP key";
    runStep(FlasherState::KeyReady, [this]() {
        const auto response{ transferChecked(common::IspCommand::ispKey(std::vector<uint8_t>(KEY_SEED_SIZE, 0x00)),
                                             _processor.getSettings().defaultTimeout, FlasherState::KeyReady) };
        const auto expected{ common::getXorKeyChecksum(common::generateXorKey(_session.uid, _session.chip.chipId)) };
        const auto& payload{ response.getPayload() };
        if(!payload.empty() && payload[0] != expected) {
            const auto message{ "ISP key checksum mismatch: expected " + common::toHexString(expected) + ", got "
                                + common::toHexString(payload[0]) };
            if(_processor.getSettings().strictKeyChecksum) {
                throw FlasherError(FlasherState::KeyReady, common::ErrorKind::DeviceRejected, message);
            }
            LOG(WARNING) << message;
        }
    });
    setCurrentState(FlasherState::KeyReady);
}

void IspFlasher::program(const std::vector<uint8_t>& firmware)
{
    LOG(INFO) << "Programming " << firmware.size() << " bytes";
    runStep(FlasherState::Programmed, [this, &firmware]() {
        transferChunks(firmware, FlasherState::Programmed, &common::IspCommand::program);
        const auto endAddress{ static_cast<uint32_t>(firmware.size()) };
        const auto response = [&]() {
            try {
                return _processor.transfer(common::IspCommand::program(endAddress, 0x00, {}));
            }
            catch(const common::IspError& ex) {
                throw FlasherError(FlasherState::Programmed, ex, endAddress);
            }
        }();
        if(!response.isOk()) {
            throw FlasherError(FlasherState::Programmed, common::ErrorKind::DeviceRejected,
                               "final Program status " + common::toHexString(response.getStatus()), endAddress,
                               response.getStatus());
        }
    });
    setCurrentState(FlasherState::Programmed);
}

void IspFlasher::verify(const std::vector<uint8_t>& firmware)
{
    LOG(INFO) << "Verifying " << firmware.size() << " bytes";
    runStep(FlasherState::Verified, [this, &firmware]() {
        transferChunks(firmware, FlasherState::Verified, &common::IspCommand::verify);
    });
    setCurrentState(FlasherState::Verified);
}

void IspFlasher::reset()
{
    LOG(INFO) << "Resetting chip";
    runStep(FlasherState::Reset, [this]() {
        const auto response{ _processor.transfer(common::IspCommand::ispEnd(1)) };
        if(!response.isOk()) {
            LOG(WARNING) << "Reset returned status " << common::toHexString(response.getStatus());
        }
    });
    setCurrentState(FlasherState::Reset);
}

void IspFlasher::eraseEeprom()
{
    runStep(FlasherState::Erased, [this]() {
        if(_session.chip.eepromSize == 0) {
            throw common::IspError(common::ErrorKind::UnsupportedFeature,
                                   _session.chip.toString() + " has no EEPROM");
        }
        const auto sectors{ eepromSectorsNeeded(_session.chip) };
        LOG(INFO) << "Erasing " << sectors << " EEPROM sectors";
        transferChecked(common::IspCommand::dataErase(sectors), _processor.getSettings().dataEraseTimeout,
                        FlasherState::Erased);
    });
    setCurrentState(FlasherState::Erased);
}

void IspFlasher::transferChunks(const std::vector<uint8_t>& firmware, FlasherState state,
                                const ChunkCommandFactory& factory)
{
    const bool isVerify{ state == FlasherState::Verified };
    // Keyed the same way for every chunk.
    const common::XOREncryptor encryptor{ common::generateXorKey(_session.uid, _session.chip.chipId) };
    std::uniform_int_distribution<int> paddingDistribution{ 0x00, 0xFF };

    startProgress(firmware.size());
    for(size_t offset = 0; offset < firmware.size(); offset += CHUNK_SIZE) {
        const auto address{ static_cast<uint32_t>(offset) };
        const auto end{ std::min(offset + CHUNK_SIZE, firmware.size()) };
        const auto chunk{ encryptor.encrypt(std::vector<uint8_t>(firmware.cbegin() + offset, firmware.cbegin() + end)) };
        const auto padding{ static_cast<uint8_t>(paddingDistribution(_random)) };

        const auto response = [&]() {
            try {
                return _processor.transfer(factory(address, padding, chunk), _processor.getSettings().programTimeout);
            }
            catch(const common::IspError& ex) {
                throw FlasherError(state, ex, address);
            }
        }();

        if(!response.isOk()) {
            throw FlasherError(state, common::ErrorKind::DeviceRejected,
                               "status " + common::toHexString(response.getStatus()), address,
                               response.getStatus());
        }
        const auto& payload{ response.getPayload() };
        if(isVerify && !payload.empty() && payload[0] != 0x00) {
            throw FlasherError(state, common::ErrorKind::VerificationMismatch,
                               "content differs, device reports " + common::toHexString(payload[0]), address);
        }
        setCurrentProgress(end);
    }
}

common::IspResponse IspFlasher::transferChecked(const common::IspCommand& command, std::chrono::milliseconds timeout,
                                                FlasherState state)
{
    auto response{ _processor.transfer(command, timeout) };
    if(!response.isOk()) {
        throw FlasherError(state, common::ErrorKind::DeviceRejected,
                           common::toString(command.getType()) + " status " + common::toHexString(response.getStatus()),
                           std::nullopt, response.getStatus());
    }
    return response;
}

void IspFlasher::setCurrentState(FlasherState state)
{
    {
        std::unique_lock<std::mutex> lock{ _mutex };
        _currentState = state;
    }
    for(const auto& callback: getCallbacks()) {
        callback->OnState(state);
    }
}

void IspFlasher::startProgress(size_t maximum)
{
    std::unique_lock<std::mutex> lock{ _mutex };
    _progressStart = std::chrono::steady_clock::now();
    _maximumProgress = maximum;
}

void IspFlasher::setCurrentProgress(size_t current)
{
    std::chrono::milliseconds elapsed;
    size_t maximum;
    {
        std::unique_lock<std::mutex> lock{ _mutex };
        elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()
                                                                        - _progressStart);
        maximum = _maximumProgress;
    }
    for(const auto& callback: getCallbacks()) {
        callback->OnProgress(elapsed, std::min(current, maximum), maximum);
    }
}

void IspFlasher::notifyError(const FlasherError& error)
{
    setCurrentState(FlasherState::Error);
    for(const auto& callback: getCallbacks()) {
        callback->OnError(error);
    }
}

std::vector<FlasherCallback*> IspFlasher::getCallbacks() const
{
    std::unique_lock<std::mutex> lock{ _mutex };
    return _callbacks;
}

} // namespace flasher
