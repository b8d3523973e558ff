// src/intake/src/IntakeSettings.cpp
#include "intake/include/IntakeSettings.hpp"
#include "common/utils/logger/Logger.hpp"
#include <stdexcept>

namespace chainsig::intake
{
    IntakeSettings IntakeSettings::FromConfig(const env::EnvConfig& config)
    {
        IntakeSettings settings;

        settings.service_account_id = config.GetStringOr("SERVICE_ACCOUNT_ID", settings.service_account_id);
        settings.domain_key_path = config.GetStringOr("DOMAIN_KEY_PATH", settings.domain_key_path);

        settings.min_deposit = config.GetUInt64Or("SIGN_MIN_DEPOSIT", settings.min_deposit);
        settings.gas_for_sign_call = config.GetUInt64Or("SIGN_GAS_FOR_SIGN_CALL", settings.gas_for_sign_call);
        settings.resume_call_gas = config.GetUInt64Or("SIGN_RESUME_CALL_GAS", settings.resume_call_gas);
        settings.yield_timeout_blocks = config.GetUInt64Or("SIGN_YIELD_TIMEOUT_BLOCKS", settings.yield_timeout_blocks);
        settings.fee_load_step = config.GetUInt64Or("SIGN_FEE_LOAD_STEP", settings.fee_load_step);

        std::string policy = config.GetStringOr("SIGN_FEE_POLICY", ToString(FeePolicyKind::FIXED));
        if (policy == ToString(FeePolicyKind::FIXED)) {
            settings.fee_policy = FeePolicyKind::FIXED;
        } else if (policy == ToString(FeePolicyKind::PENDING_LOAD)) {
            settings.fee_policy = FeePolicyKind::PENDING_LOAD;
        } else {
            throw std::runtime_error("Invalid SIGN_FEE_POLICY: " + policy);
        }

        try {
            settings.Validate();
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("Invalid intake configuration: ") + e.what());
        }

        LOG_INFOF("IntakeSettings", "min_deposit=%llu, gas_for_sign_call=%llu, resume_call_gas=%llu, fee_policy=%s",
            static_cast<unsigned long long>(settings.min_deposit),
            static_cast<unsigned long long>(settings.gas_for_sign_call),
            static_cast<unsigned long long>(settings.resume_call_gas),
            ToString(settings.fee_policy));

        return settings;
    }

    void IntakeSettings::Validate() const
    {
        if (min_deposit == 0) {
            throw std::invalid_argument("min_deposit must be at least 1");
        }
        if (resume_call_gas > gas_for_sign_call) {
            // sign 호출 임계값이 resume callback 비용을 덮지 못함
            throw std::invalid_argument("resume_call_gas must not exceed gas_for_sign_call");
        }
        if (yield_timeout_blocks == 0) {
            throw std::invalid_argument("yield_timeout_blocks must be at least 1");
        }
        if (fee_policy == FeePolicyKind::PENDING_LOAD && fee_load_step == 0) {
            throw std::invalid_argument("fee_load_step must be at least 1");
        }
        if (service_account_id.empty()) {
            throw std::invalid_argument("service_account_id must not be empty");
        }
    }
}
