#include "common/encryption/XOREncryptor.hpp"

#include "common/Util.hpp"
#include <stdexcept>

namespace common {

std::vector<uint8_t> generateXorKey(const std::vector<uint8_t>& uid, uint8_t chipId)
{
    std::vector<uint8_t> key(XOR_KEY_SIZE, wrappingSum(uid));
    key.back() = static_cast<uint8_t>(key.back() + chipId);
    return key;
}

uint8_t getXorKeyChecksum(const std::vector<uint8_t>& key)
{
    return wrappingSum(key);
}

XOREncryptor::XOREncryptor(std::vector<uint8_t>&& key)
    : _key{ std::move(key) }
{
    if(_key.empty()) {
        throw std::invalid_argument("XOR key must not be empty");
    }
}

std::vector<uint8_t> XOREncryptor::encrypt(const std::vector<uint8_t>& data) const
{
    std::vector<uint8_t> result(data.size());
    const size_t keySize{ _key.size() };
    for(size_t i = 0; i < data.size(); ++i) {
        result[i] = _key[i % keySize] ^ data[i];
    }
    return result;
}

std::vector<uint8_t> XOREncryptor::decrypt(const std::vector<uint8_t>& data) const
{
    return encrypt(data);
}

const std::vector<uint8_t>& XOREncryptor::getKey() const
{
    return _key;
}

} // namespace common
