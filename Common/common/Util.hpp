#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace common {

    template<typename T>
    void appendLittleEndian(std::vector<uint8_t>& output, T value)
    {
        static_assert(std::is_unsigned<T>::value, "Only unsigned values are supported");
        for (size_t i = 0; i < sizeof(T); ++i) {
            output.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }

    uint32_t decodeLittleEndian(const uint8_t* data, size_t size = 4);

    uint8_t wrappingSum(const std::vector<uint8_t>& data);

    std::string toHexString(uint8_t value);
    std::string toHexString(const std::vector<uint8_t>& data, const std::string& separator = " ");

    std::string toLower(std::string data);

    void initLogger(const std::string& logFilePath, bool verbose = false);

} // namespace common
