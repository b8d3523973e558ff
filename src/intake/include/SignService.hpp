// src/intake/include/SignService.hpp
#pragma once
#include "intake/include/ContinuationBridge.hpp"
#include "intake/include/FeeCollector.hpp"
#include "intake/include/IntakeSettings.hpp"
#include "intake/include/RequestRegistry.hpp"
#include "intake/include/RequestValidator.hpp"
#include "common/keys/include/IDomainKeyService.hpp"
#include "protocols/sign/include/SignRequestArgs.hpp"
#include "protocols/sign/include/SignatureResponse.hpp"
#include <memory>
#include <optional>
#include <string>

namespace chainsig::intake
{
    /**
     * @brief sign 호출 결과
     *
     * 성공 시 token 은 요청자가 결과를 받게 될 continuation 을 가리킵니다.
     */
    struct SignResult
    {
        SignError error = SignError::NONE;
        std::string message;
        std::optional<host::ContinuationToken> token;
        CryptoHash fingerprint{};
        Balance refund = 0;

        bool IsOk() const { return error == SignError::NONE; }

        static SignResult Rejected(SignError error, std::string message)
        {
            SignResult result;
            result.error = error;
            result.message = std::move(message);
            return result;
        }
    };

    /**
     * @brief 서명 요청 접수 서비스
     *
     * 호출 흐름: RequestValidator → FeeCollector → ContinuationBridge::Create
     * 이후 MPC 클러스터가 Respond 로 결과를 넘기면 호스트가 continuation 을 재개하고
     * ContinuationBridge 가 레지스트리를 정리합니다.
     *
     * 생성 시 호스트에 resume entry point 와 레지스트리를 등록하고 소멸 시 해제합니다.
     * 호스트는 이 서비스보다 먼저 소멸하면 안 되며, 모든 메서드는 호스트 호출 안에서 실행되어야 합니다.
     * 서비스가 먼저 사라지면 남아 있던 continuation 은 재개 시 FAILED 로 전달됩니다.
     */
    class SignService
    {
    public:
        SignService(host::IHostEnvironment& host, const keys::IDomainKeyService& key_service, IntakeSettings settings);

        ~SignService();

        SignService(const SignService&) = delete;
        SignService& operator=(const SignService&) = delete;

        /**
         * @brief 서명 요청 (예치금/선불 가스는 호스트 호출 컨텍스트에서 읽음)
         * @throws IntakeFault 내부 일관성 오류 (호출 전체가 롤백되어야 함)
         */
        SignResult Sign(const protocol::sign::SignRequestArgs& args);

        /**
         * @brief JSON 인자 버전. 인자 해석 실패는 MALFORMED_REQUEST / INVALID_PAYLOAD
         */
        SignResult SignJson(const std::string& json_args);

        /**
         * @brief MPC 클러스터의 서명 결과 전달
         *
         * 서명 형식이 payload 와 맞지 않으면 Failure(MalformedResult) 로 재개합니다.
         */
        RespondStatus Respond(
            const protocol::sign::SignatureRequest& request,
            const protocol::sign::SignatureResponse& response);

        std::optional<host::ContinuationToken> GetPendingRequest(const protocol::sign::SignatureRequest& request) const;

        /**
         * @brief 도메인 공개키 조회 (domain_id 생략 시 0)
         * @throws keys::DomainNotFoundException
         */
        keys::PublicKeyDescriptor PublicKey(std::optional<DomainId> domain_id = std::nullopt) const;

        std::optional<DomainId> LatestKeyVersion() const;

        const IntakeSettings& Settings() const { return settings; }
        const RequestRegistry& Registry() const { return registry; }

    private:
        host::IHostEnvironment& host;
        const keys::IDomainKeyService& key_service;
        IntakeSettings settings;

        std::unique_ptr<IFeePolicy> fee_policy;
        RequestRegistry registry;
        RequestValidator validator;
        FeeCollector fee_collector;
        ContinuationBridge bridge;
    };
}
