#pragma once

#include "EncryptorBase.hpp"

#include <cstddef>

namespace common {

constexpr size_t XOR_KEY_SIZE = 8;

// Session key derived from the device UID: eight copies of the UID byte sum,
// the last one offset by the chip id.
std::vector<uint8_t> generateXorKey(const std::vector<uint8_t>& uid, uint8_t chipId);

// Value the bootloader echoes back after IspKey when it derived the same key.
uint8_t getXorKeyChecksum(const std::vector<uint8_t>& key);

class XOREncryptor: public EncryptorBase {
public:
    explicit XOREncryptor(std::vector<uint8_t>&& key);

    virtual std::vector<uint8_t> encrypt(const std::vector<uint8_t>& data) const override;
    virtual std::vector<uint8_t> decrypt(const std::vector<uint8_t>& data) const override;

    const std::vector<uint8_t>& getKey() const;

private:
    const std::vector<uint8_t> _key;
};

} // namespace common
