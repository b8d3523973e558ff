// src/common/keys/include/PublicKeyDescriptor.hpp
#pragma once
#include "common/types/BasicTypes.hpp"
#include <string>
#include <vector>

namespace chainsig::keys
{
    constexpr size_t SECP256K1_PUBLIC_KEY_SIZE = 64;   // 비압축 x || y (0x04 접두사 제외)
    constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;

    /**
     * @brief 도메인 공개키 설명자
     *
     * 텍스트 형식: "secp256k1:<hex>" 또는 "ed25519:<hex>"
     */
    struct PublicKeyDescriptor
    {
        CurveType curve = CurveType::UNKNOWN;
        std::vector<uint8_t> key_bytes;

        CurveType GetCurveType() const { return curve; }

        std::string ToString() const;

        /**
         * @throws InvalidPublicKeyException 곡선 이름, hex, 길이 중 하나라도 잘못된 경우
         */
        static PublicKeyDescriptor FromString(const std::string& text);

        bool operator==(const PublicKeyDescriptor& other) const
        {
            return curve == other.curve && key_bytes == other.key_bytes;
        }
    };
}
