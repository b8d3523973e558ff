// src/intake/include/RequestValidator.hpp
#pragma once
#include "intake/include/IntakeErrors.hpp"
#include "common/keys/include/IDomainKeyService.hpp"
#include "protocols/sign/include/Payload.hpp"
#include <string>

namespace chainsig::intake
{
    struct ValidationResult
    {
        SignError error = SignError::NONE;
        std::string message;
        keys::PublicKeyDescriptor public_key;   // 성공 시에만 유효

        bool IsValid() const { return error == SignError::NONE; }
    };

    /**
     * @brief sign 요청 사전 검사 (상태 변경 없음)
     *
     * 검사 순서: 도메인 키 → 곡선/payload → 예약 가스
     * MPC 노드와 같은 방식으로 실패해야 호출자가 에러를 받아볼 수 있습니다.
     */
    class RequestValidator
    {
    public:
        RequestValidator(const keys::IDomainKeyService& key_service, Gas required_gas);

        /**
         * @throws IntakeFault 키 저장소 자체가 실패한 경우 (도메인 없음은 에러 값으로 반환)
         */
        ValidationResult Validate(
            DomainId domain_id,
            const protocol::sign::Payload& payload,
            Gas reserved_gas) const;

        Gas RequiredGas() const { return required_gas; }

    private:
        const keys::IDomainKeyService& key_service;
        Gas required_gas;
    };
}
