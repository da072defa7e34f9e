#include "common/Util.hpp"

#include <easylogging++.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace common {

    uint32_t decodeLittleEndian(const uint8_t* data, size_t size)
    {
        uint32_t result = 0;
        for (size_t i = 0; i < size && i < sizeof(result); ++i) {
            result |= static_cast<uint32_t>(data[i]) << (8 * i);
        }
        return result;
    }

    uint8_t wrappingSum(const std::vector<uint8_t>& data)
    {
        return std::accumulate(data.cbegin(), data.cend(), uint8_t{ 0 },
            [](uint8_t acc, uint8_t value) {
                return static_cast<uint8_t>(acc + value);
            });
    }

    std::string toHexString(uint8_t value)
    {
        std::stringstream stream;
        stream << "0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(2) << static_cast<int>(value);
        return stream.str();
    }

    std::string toHexString(const std::vector<uint8_t>& data, const std::string& separator)
    {
        std::stringstream stream;
        stream << std::hex << std::uppercase << std::setfill('0');
        for (size_t i = 0; i < data.size(); ++i) {
            if (i != 0) {
                stream << separator;
            }
            stream << std::setw(2) << static_cast<int>(data[i]);
        }
        return stream.str();
    }

    std::string toLower(std::string data)
    {
        std::transform(data.begin(), data.end(), data.begin(),
            [](unsigned char c) { return std::tolower(c); });
        return data;
    }

    void initLogger(const std::string& logFilePath, bool verbose)
    {
        el::Configurations conf;
        conf.setToDefault();
        conf.setGlobally(el::ConfigurationType::Format, "%datetime %level [%thread] %msg");
        conf.setGlobally(el::ConfigurationType::Filename, logFilePath);
        conf.setGlobally(el::ConfigurationType::ToFile, "true");
        conf.setGlobally(el::ConfigurationType::ToStandardOutput, verbose ? "true" : "false");
        conf.set(el::Level::Debug, el::ConfigurationType::Enabled, verbose ? "true" : "false");
        el::Loggers::reconfigureAllLoggers(conf);
    }

} // namespace common
