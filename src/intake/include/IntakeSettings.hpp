// src/intake/include/IntakeSettings.hpp
#pragma once
#include "common/env/EnvConfig.hpp"
#include "common/types/BasicTypes.hpp"
#include <string>

namespace chainsig::intake
{
    enum class FeePolicyKind : uint8_t
    {
        FIXED = 0,
        PENDING_LOAD = 1
    };

    inline const char* ToString(FeePolicyKind kind)
    {
        switch (kind) {
            case FeePolicyKind::FIXED: return "fixed";
            case FeePolicyKind::PENDING_LOAD: return "load";
            default: return "unknown";
        }
    }

    /**
     * @brief 요청 접수 계층 설정값
     */
    struct IntakeSettings
    {
        AccountId service_account_id = "signer.local";
        std::string domain_key_path = "./domain_keys";

        Balance min_deposit = DEFAULT_MIN_SIGN_DEPOSIT;
        Gas gas_for_sign_call = DEFAULT_GAS_FOR_SIGN_CALL;
        Gas resume_call_gas = DEFAULT_RESUME_CALL_GAS;
        BlockHeight yield_timeout_blocks = DEFAULT_YIELD_TIMEOUT_BLOCKS;

        FeePolicyKind fee_policy = FeePolicyKind::FIXED;
        uint64_t fee_load_step = 16;

        static IntakeSettings Defaults() { return IntakeSettings(); }

        /**
         * @brief env 설정에서 읽기 (없는 키는 기본값)
         * @throws std::runtime_error 값 형식이 잘못되었거나 조합이 불가능한 경우
         */
        static IntakeSettings FromConfig(const env::EnvConfig& config);

        /**
         * @throws std::invalid_argument 최소 예치금 0, resume 가스 > sign 가스, load step 0 등
         */
        void Validate() const;
    };
}
