// src/protocols/sign/include/SignatureResponse.hpp
#pragma once
#include "protocols/sign/include/Payload.hpp"
#include <optional>
#include <vector>

namespace chainsig::protocol::sign
{
    constexpr size_t SECP256K1_BIG_R_SIZE = 33;   // 압축 포인트
    constexpr size_t SECP256K1_SCALAR_SIZE = 32;
    constexpr uint8_t SECP256K1_MAX_RECOVERY_ID = 3;
    constexpr size_t ED25519_SIGNATURE_SIZE = 64;

    enum class SignatureScheme : uint8_t
    {
        SECP256K1 = 0,
        ED25519 = 1
    };

    /**
     * @brief MPC 클러스터가 돌려주는 서명
     *
     * Secp256k1: {"scheme":"Secp256k1","big_r":{"affine_point":hex},"s":{"scalar":hex},"recovery_id":n}
     * Ed25519:   {"scheme":"Ed25519","signature":[64 x u8]}
     */
    struct SignatureResponse
    {
        SignatureScheme scheme = SignatureScheme::SECP256K1;

        // Secp256k1
        std::vector<uint8_t> big_r;
        std::vector<uint8_t> s;
        uint8_t recovery_id = 0;

        // Ed25519
        std::vector<uint8_t> signature;

        static SignatureResponse Secp256k1(std::vector<uint8_t> big_r, std::vector<uint8_t> s, uint8_t recovery_id);
        static SignatureResponse Ed25519(std::vector<uint8_t> signature);

        // 형식만 검사 (서명 검증은 하지 않음)
        bool IsWellFormed() const;
        bool MatchesPayload(PayloadType type) const;

        nlohmann::json ToJson() const;
        static std::optional<SignatureResponse> FromJson(const nlohmann::json& j);

        bool operator==(const SignatureResponse& other) const
        {
            return scheme == other.scheme && big_r == other.big_r && s == other.s &&
                   recovery_id == other.recovery_id && signature == other.signature;
        }
    };
}
