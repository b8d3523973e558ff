// src/protocols/sign/include/SignOutcome.hpp
#pragma once
#include "protocols/sign/include/SignatureResponse.hpp"
#include <optional>
#include <string>

namespace chainsig::protocol::sign
{
    /**
     * @brief 비동기 실패 사유 (finalize 경로로만 전달)
     */
    enum class FailureReason : uint8_t
    {
        TIMEOUT = 0,
        MALFORMED_RESULT = 1
    };

    inline const char* ToString(FailureReason reason)
    {
        switch (reason) {
            case FailureReason::TIMEOUT: return "Timeout";
            case FailureReason::MALFORMED_RESULT: return "MalformedResult";
            default: return "Unknown";
        }
    }

    /**
     * @brief continuation 재개 시 전달되는 결과: Success(signature) | Failure(reason)
     */
    struct SignOutcome
    {
        std::optional<SignatureResponse> signature;
        FailureReason reason = FailureReason::TIMEOUT;

        static SignOutcome Success(SignatureResponse response)
        {
            SignOutcome outcome;
            outcome.signature = std::move(response);
            return outcome;
        }

        static SignOutcome Failure(FailureReason reason)
        {
            SignOutcome outcome;
            outcome.reason = reason;
            return outcome;
        }

        bool IsSuccess() const { return signature.has_value(); }

        // 호스트 resume payload 형식 ({"Ok": {...}} / {"Err": "Timeout"})
        std::string Serialize() const;
        static std::optional<SignOutcome> Deserialize(const std::string& data);
    };
}
