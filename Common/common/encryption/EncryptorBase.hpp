#pragma once

#include <cstdint>
#include <vector>

namespace common {

class EncryptorBase {
public:
    EncryptorBase();
    virtual ~EncryptorBase();

    virtual std::vector<uint8_t> encrypt(const std::vector<uint8_t>& data) const = 0;
    virtual std::vector<uint8_t> decrypt(const std::vector<uint8_t>& data) const = 0;
};

} // namespace common
