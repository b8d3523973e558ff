// src/host/include/ContinuationToken.hpp
#pragma once
#include "common/types/BasicTypes.hpp"
#include "common/utils/hex/HexUtils.hpp"
#include <algorithm>
#include <optional>
#include <string>

namespace chainsig::host
{
    /**
     * @brief 호스트가 발급하는 continuation 식별자 (불투명 값)
     *
     * 살아 있는 suspend 호출 하나를 가리키며, 한 번만 재개됩니다.
     */
    struct ContinuationToken
    {
        CryptoHash id{};

        std::string ToHex() const { return utils::BytesToHex(id); }

        static std::optional<ContinuationToken> FromHex(const std::string& hex)
        {
            auto bytes = utils::HexToBytes(hex);
            if (!bytes || bytes->size() != CryptoHash().size()) {
                return std::nullopt;
            }
            ContinuationToken token;
            std::copy(bytes->begin(), bytes->end(), token.id.begin());
            return token;
        }

        bool operator==(const ContinuationToken& other) const { return id == other.id; }
        bool operator!=(const ContinuationToken& other) const { return id != other.id; }
    };

    struct ContinuationTokenHasher
    {
        size_t operator()(const ContinuationToken& token) const noexcept
        {
            return CryptoHashHasher{}(token.id);
        }
    };
}
