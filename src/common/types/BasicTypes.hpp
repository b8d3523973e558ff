// src/common/types/BasicTypes.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace chainsig
{
    using Gas = uint64_t;
    using Balance = uint64_t;      // 최소 단위 (yocto)
    using DomainId = uint64_t;
    using BlockHeight = uint64_t;
    using AccountId = std::string;

    using CryptoHash = std::array<uint8_t, 32>;
    using RandomSeed = std::array<uint8_t, 32>;

    constexpr Gas TGAS = 1000000000000ULL;

    // 관측된 기본값 (env 설정으로 덮어쓸 수 있음)
    constexpr Balance DEFAULT_MIN_SIGN_DEPOSIT = 1;
    constexpr Gas DEFAULT_GAS_FOR_SIGN_CALL = 10 * TGAS;
    constexpr Gas DEFAULT_RESUME_CALL_GAS = 7 * TGAS;
    constexpr BlockHeight DEFAULT_YIELD_TIMEOUT_BLOCKS = 200;

    constexpr size_t ECDSA_PAYLOAD_SIZE = 32;
    constexpr size_t EDDSA_MIN_PAYLOAD_SIZE = 32;
    constexpr size_t EDDSA_MAX_PAYLOAD_SIZE = 1232;

    /**
     * @brief 도메인 키의 서명 곡선 타입
     */
    enum class CurveType : uint8_t
    {
        SECP256K1 = 0,   // ECDSA 계열
        ED25519 = 1,     // EdDSA 계열
        UNKNOWN = 99
    };

    inline const char* CurveTypeToString(CurveType type)
    {
        switch (type) {
            case CurveType::SECP256K1: return "secp256k1";
            case CurveType::ED25519: return "ed25519";
            default: return "unknown";
        }
    }

    inline CurveType CurveTypeFromString(const std::string& str)
    {
        if (str == "secp256k1" || str == "SECP256K1") return CurveType::SECP256K1;
        if (str == "ed25519" || str == "ED25519") return CurveType::ED25519;
        return CurveType::UNKNOWN;
    }

    struct CryptoHashHasher
    {
        size_t operator()(const CryptoHash& hash) const noexcept
        {
            // 입력이 이미 해시값이므로 앞 8바이트로 충분
            size_t value = 0;
            std::memcpy(&value, hash.data(), sizeof(value));
            return value;
        }
    };
}
