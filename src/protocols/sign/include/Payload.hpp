// src/protocols/sign/include/Payload.hpp
#pragma once
#include "common/types/BasicTypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace chainsig::protocol::sign
{
    enum class PayloadType : uint8_t
    {
        ECDSA = 0,   // 32바이트 해시
        EDDSA = 1    // 32..1232바이트 메시지
    };

    inline const char* PayloadTypeToString(PayloadType type)
    {
        switch (type) {
            case PayloadType::ECDSA: return "Ecdsa";
            case PayloadType::EDDSA: return "Eddsa";
            default: return "Unknown";
        }
    }

    /**
     * @brief 곡선 태그가 붙은 서명 대상 데이터
     *
     * 생성 함수는 길이만 검사합니다. 곡선/스칼라 검사는 RequestValidator 담당.
     */
    struct Payload
    {
        PayloadType type = PayloadType::ECDSA;
        std::vector<uint8_t> bytes;

        static std::optional<Payload> Ecdsa(std::vector<uint8_t> hash);
        static std::optional<Payload> Eddsa(std::vector<uint8_t> message);

        bool IsEcdsa() const { return type == PayloadType::ECDSA; }
        bool IsEddsa() const { return type == PayloadType::EDDSA; }

        // {"Ecdsa":"<hex>"} / {"Eddsa":"<hex>"}
        nlohmann::json ToJson() const;
        static std::optional<Payload> FromJson(const nlohmann::json& j);

        bool operator==(const Payload& other) const
        {
            return type == other.type && bytes == other.bytes;
        }
    };
}
