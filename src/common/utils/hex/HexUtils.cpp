// src/common/utils/hex/HexUtils.cpp
#include "common/utils/hex/HexUtils.hpp"
#include <iomanip>
#include <sstream>

namespace chainsig::utils
{
    namespace
    {
        int HexValue(char c)
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    }

    std::string BytesToHex(const uint8_t* data, size_t length)
    {
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < length; ++i) {
            ss << std::setw(2) << static_cast<int>(data[i]);
        }
        return ss.str();
    }

    std::optional<std::vector<uint8_t>> HexToBytes(const std::string& hex)
    {
        if (hex.size() % 2 != 0) {
            return std::nullopt;
        }

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.size() / 2);

        for (size_t i = 0; i < hex.size(); i += 2) {
            int high = HexValue(hex[i]);
            int low = HexValue(hex[i + 1]);
            if (high < 0 || low < 0) {
                return std::nullopt;
            }
            bytes.push_back(static_cast<uint8_t>((high << 4) | low));
        }

        return bytes;
    }
}
