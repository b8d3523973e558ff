// src/common/utils/hex/HexUtils.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chainsig::utils
{
    std::string BytesToHex(const uint8_t* data, size_t length);

    template<typename TContainer>
    std::string BytesToHex(const TContainer& bytes)
    {
        return BytesToHex(bytes.data(), bytes.size());
    }

    // 홀수 길이이거나 hex 문자가 아니면 nullopt
    std::optional<std::vector<uint8_t>> HexToBytes(const std::string& hex);
}
