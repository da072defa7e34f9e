#include "flasher/ChipReader.hpp"

#include <common/ChipRegistry.hpp>
#include <common/protocols/IspError.hpp>
#include <common/protocols/IspRequestProcessor.hpp>
#include <common/Util.hpp>

#include <easylogging++.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace flasher {

ChipReader::ChipReader(const common::IspRequestProcessor& processor, const common::ChipRegistry& registry)
    : _processor{ processor }
    , _registry{ registry }
{
}

std::pair<uint8_t, uint8_t> ChipReader::identify() const
{
    const auto response{ _processor.transfer(common::IspCommand::identify(0, 0)) };
    if(!response.isOk()) {
        throw common::IspError(common::ErrorKind::DeviceRejected,
                               "Identify status " + common::toHexString(response.getStatus()),
                               common::IspError::ErrorCode::Generic, response.getStatus());
    }
    const auto& payload{ response.getPayload() };
    if(payload.size() < 2) {
        throw common::IspError(common::ErrorKind::ProtocolDecodeError,
                               "Identify payload of " + std::to_string(payload.size()) + " bytes",
                               common::IspError::ErrorCode::TruncatedFrame);
    }
    return { payload[0], payload[1] };
}

common::IspResponse ChipReader::readConfig(uint32_t mask) const
{
    return _processor.transfer(common::IspCommand::readConfig(mask));
}

void ChipReader::applyConfig(const common::IspResponse& response, FlashSession& session) const
{
    const auto& payload{ response.getPayload() };
    if(payload.size() < UID_OFFSET) {
        LOG(WARNING) << "Config payload too short: " << payload.size() << " bytes";
        return;
    }
    session.configData.assign(payload.cbegin() + CONFIG_OFFSET, payload.cbegin() + CONFIG_OFFSET + CONFIG_SIZE);
    std::copy(payload.cbegin() + BTVER_OFFSET, payload.cbegin() + UID_OFFSET, session.bootloaderVersion.begin());
    if(session.chip.supportsCodeFlashProtect()) {
        session.codeFlashProtected = payload[CONFIG_OFFSET] != RDPR_UNPROTECTED;
    }
    if(payload.size() > UID_OFFSET) {
        session.uid.assign(payload.cbegin() + UID_OFFSET, payload.cend());
    }
    LOG(DEBUG) << "Config read: BTVER=" << common::toHexString(
        std::vector<uint8_t>(session.bootloaderVersion.cbegin(), session.bootloaderVersion.cend()), ".")
               << ", protected=" << session.codeFlashProtected;
}

void ChipReader::unprotect(FlashSession& session) const
{
    const auto readResponse{ readConfig(common::CFG_MASK_RDPR_USER_DATA_WPR) };
    if(!readResponse.isOk()) {
        throw common::IspError(common::ErrorKind::DeviceRejected,
                               "ReadConfig status " + common::toHexString(readResponse.getStatus()),
                               common::IspError::ErrorCode::Generic, readResponse.getStatus());
    }
    const auto& payload{ readResponse.getPayload() };
    if(payload.size() < CONFIG_OFFSET + CONFIG_SIZE) {
        throw common::IspError(common::ErrorKind::ProtocolDecodeError,
                               "ReadConfig payload of " + std::to_string(payload.size()) + " bytes",
                               common::IspError::ErrorCode::TruncatedFrame);
    }

    std::vector<uint8_t> config(payload.cbegin() + CONFIG_OFFSET, payload.cbegin() + CONFIG_OFFSET + CONFIG_SIZE);
    config[0] = RDPR_UNPROTECTED;
    config[1] = 0x5A;
    // WPR, all pages writable
    std::fill(config.begin() + 8, config.begin() + 12, 0xFF);

    const auto writeResponse{ _processor.transfer(
        common::IspCommand::writeConfig(common::CFG_MASK_RDPR_USER_DATA_WPR, config)) };
    if(!writeResponse.isOk()) {
        throw common::IspError(common::ErrorKind::DeviceRejected,
                               "WriteConfig status " + common::toHexString(writeResponse.getStatus()),
                               common::IspError::ErrorCode::Generic, writeResponse.getStatus());
    }
    session.configData = std::move(config);
    session.codeFlashProtected = false;
    LOG(INFO) << "Code flash unprotected";
}

FlashSession ChipReader::open() const
{
    const auto id{ identify() };
    FlashSession session;
    session.chip = _registry.lookup(id.first, id.second);
    LOG(INFO) << "Identified chip: " << session.chip.toString();
    if(!_registry.isSupported(id.first, id.second)) {
        LOG(WARNING) << "Chip " << session.chip.toString() << " isn't in the chip table, using defaults";
    }

    const auto response{ readConfig(common::CFG_MASK_ALL) };
    if(response.isOk()) {
        applyConfig(response, session);
    }
    else {
        LOG(WARNING) << "Failed to read chip configuration, status " << common::toHexString(response.getStatus());
    }
    return session;
}

std::string ChipReader::describe(const FlashSession& session)
{
    const auto& chip{ session.chip };
    std::stringstream stream;
    stream << "Chip: " << chip.toString() << " (Code Flash: " << chip.flashSize / 1024 << "KiB";
    if(chip.eepromSize > 0) {
        stream << ", EEPROM: " << chip.eepromSize / 1024 << "KiB";
    }
    stream << ")";
    if(!session.uid.empty()) {
        stream << "\nChip UID: " << common::toHexString(session.uid, "-");
    }
    stream << "\nBTVER: " << std::hex << std::setfill('0');
    for(size_t i = 0; i < session.bootloaderVersion.size(); ++i) {
        stream << (i == 0 ? "" : ".") << std::setw(2) << static_cast<int>(session.bootloaderVersion[i]);
    }
    stream << std::dec;
    if(chip.supportsCodeFlashProtect()) {
        stream << "\nCode Flash Protected: " << (session.codeFlashProtected ? "true" : "false");
    }
    for(const auto& reg: chip.configRegisters) {
        if(reg.offset + 4 > session.configData.size()) {
            continue;
        }
        const auto value{ common::decodeLittleEndian(session.configData.data() + reg.offset) };
        stream << "\n" << reg.name << ": 0x" << std::hex << std::uppercase << std::setw(8) << value;
        if(reg.reset && *reg.reset != value) {
            stream << " (reset 0x" << std::setw(8) << *reg.reset << ")";
        }
        stream << std::dec << std::nouppercase;
    }
    return stream.str();
}

} // namespace flasher
