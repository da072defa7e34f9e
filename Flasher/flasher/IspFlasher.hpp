#pragma once

#include "ChipReader.hpp"
#include "FlasherState.hpp"
#include "FlashSession.hpp"

#include <common/ChipRegistry.hpp>
#include <common/ProtocolSettings.hpp>
#include <common/protocols/IspRequestProcessor.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

namespace common {
class ITransport;
} // namespace common

namespace flasher {

class FlasherCallback;
class FlasherError;

// Drives one identified device through the ISP sequence. Every failing step
// raises FlasherError and leaves the flasher in FlasherState::Error.
class IspFlasher {
public:
    static constexpr size_t CHUNK_SIZE = 56;
    static constexpr size_t KEY_SEED_SIZE = 0x1E;

    static uint32_t sectorsNeeded(size_t imageSize, const common::ChipInfo& chip);
    static uint16_t eepromSectorsNeeded(const common::ChipInfo& chip);

    // Identifies the device and reads its configuration.
    IspFlasher(std::shared_ptr<common::ITransport> transport,
               const common::ChipRegistry& registry = common::getDefaultChipRegistry(),
               const common::ProtocolSettings& settings = {});
    ~IspFlasher();

    const FlashSession& getSession() const;
    const common::ChipInfo& getChip() const;
    std::string describe() const;

    FlasherState getCurrentState() const;

    void registerCallback(FlasherCallback& callback);
    void unregisterCallback(FlasherCallback& callback);

    // unprotect if needed, erase, setupKey, program
    void flash(const std::vector<uint8_t>& firmware);

    void unprotect();
    void erase(uint32_t sectors);
    void eraseAll();
    void setupKey();
    void program(const std::vector<uint8_t>& firmware);
    void verify(const std::vector<uint8_t>& firmware);
    void reset();
    void eraseEeprom();

private:
    using ChunkCommandFactory = std::function<common::IspCommand(uint32_t, uint8_t, const std::vector<uint8_t>&)>;

    template<typename Callable>
    auto runStep(FlasherState failState, Callable&& callable) -> decltype(callable());

    void transferChunks(const std::vector<uint8_t>& firmware, FlasherState state, const ChunkCommandFactory& factory);

    common::IspResponse transferChecked(const common::IspCommand& command, std::chrono::milliseconds timeout,
                                        FlasherState state);

    void setCurrentState(FlasherState state);
    void startProgress(size_t maximum);
    void setCurrentProgress(size_t current);
    void notifyError(const FlasherError& error);
    std::vector<FlasherCallback*> getCallbacks() const;

private:
    std::shared_ptr<common::ITransport> _transport;
    common::IspRequestProcessor _processor;
    ChipReader _reader;
    FlashSession _session;
    std::mt19937 _random;

    mutable std::mutex _mutex;
    FlasherState _currentState;
    std::chrono::steady_clock::time_point _progressStart;
    size_t _maximumProgress;
    std::vector<FlasherCallback*> _callbacks;
};

} // namespace flasher
