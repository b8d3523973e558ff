// src/protocols/sign/include/SignatureRequest.hpp
#pragma once
#include "protocols/sign/include/Payload.hpp"
#include <optional>
#include <string>

namespace chainsig::protocol::sign
{
    // 요청자와 경로를 tweak 에 묶을 때 쓰는 도메인 분리 접두사
    constexpr const char* TWEAK_DERIVATION_PREFIX = "chainsig v1 epsilon derivation:";
    constexpr char ACCOUNT_DATA_SEPARATOR = ',';

    constexpr size_t MIN_ACCOUNT_ID_LEN = 2;
    constexpr size_t MAX_ACCOUNT_ID_LEN = 64;

    /**
     * @brief 계정 ID 형식 검사
     *
     * 2~64자, 소문자/숫자 파트를 '.', '-', '_' 로 구분 (구분자는 연속/양끝 불가).
     * ','는 허용되지 않으므로 tweak 입력에서 요청자와 경로의 경계가 유일하게 결정됩니다.
     */
    bool IsValidAccountId(const AccountId& account_id);

    /**
     * @brief tweak = SHA3-256(prefix || requester || "," || path)
     * @throws std::invalid_argument requester 가 유효한 계정 ID 가 아닌 경우
     */
    CryptoHash DeriveTweak(const AccountId& requester, const std::string& path);

    /**
     * @brief 수락된 서명 요청 (불변 값)
     *
     * 요청자와 derivation path 는 tweak 로만 남습니다.
     * 동일한 (domain_id, payload, requester, path) 는 항상 같은 fingerprint 를 가집니다.
     */
    struct SignatureRequest
    {
        DomainId domain_id = 0;
        CryptoHash tweak{};
        Payload payload;

        static SignatureRequest Create(
            DomainId domain_id,
            Payload payload,
            const AccountId& requester,
            const std::string& path);

        /**
         * @brief SHA-256(domain_id_le64 || tweak || payload_tag || payload_bytes)
         */
        CryptoHash Fingerprint() const;

        /**
         * @brief continuation 인자용 protobuf 직렬화
         * @throws std::runtime_error 직렬화 실패 시
         */
        std::string Serialize() const;
        static std::optional<SignatureRequest> Deserialize(const std::string& data);

        // {"domain_id": n, "tweak": "<hex>", "payload": {"Ecdsa": "<hex>"}}
        nlohmann::json ToJson() const;
        static std::optional<SignatureRequest> FromJson(const nlohmann::json& j);

        bool operator==(const SignatureRequest& other) const
        {
            return domain_id == other.domain_id && tweak == other.tweak && payload == other.payload;
        }
    };
}
