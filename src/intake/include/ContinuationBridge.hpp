// src/intake/include/ContinuationBridge.hpp
#pragma once
#include "intake/include/IntakeErrors.hpp"
#include "intake/include/RequestRegistry.hpp"
#include "host/include/IHostEnvironment.hpp"
#include "protocols/sign/include/SignatureRequest.hpp"
#include "protocols/sign/include/SignOutcome.hpp"
#include <optional>
#include <string>

namespace chainsig::intake
{
    /**
     * @brief 동기 sign 호출과 외부에서 완료되는 MPC 서명을 잇는 suspend/resume 브리지
     *
     * Created → Suspended → Resumed(Success | Failure) → Cleaned
     *
     * Create 는 검증과 수수료 징수가 끝난 뒤에만 호출해야 합니다.
     * Finalize 는 레지스트리에 남아 있는 토큰에 대해서만 정리하며,
     * 이미 정리되었거나 덮어쓰인 토큰은 로그만 남기고 넘어갑니다.
     */
    class ContinuationBridge
    {
    public:
        static constexpr const char* RESUME_ENTRY_POINT = "return_signature_and_clean_state_on_success";

        ContinuationBridge(host::IHostEnvironment& host, RequestRegistry& registry, Gas resume_gas);

        /**
         * @brief continuation 생성 후 레지스트리 등록
         * @throws IntakeFault 호스트가 토큰을 발급하지 못한 경우
         */
        host::ContinuationToken Create(const protocol::sign::SignatureRequest& request);

        /**
         * @brief 대기 중인 요청의 continuation 에 결과 전달 요청
         */
        RespondStatus Resume(const protocol::sign::SignatureRequest& request, const protocol::sign::SignOutcome& outcome);

        /**
         * @brief 결과 소비 및 정리
         * @return 요청자에게 전달할 결과 (정리할 항목이 없으면 nullopt)
         */
        std::optional<protocol::sign::SignOutcome> Finalize(
            const host::ContinuationToken& token,
            const protocol::sign::SignatureRequest& request,
            const protocol::sign::SignOutcome& outcome);

        /**
         * @brief 호스트 entry point 진입부
         *
         * resume_payload 가 없으면 Timeout, 해석할 수 없으면 MalformedResult 로 처리
         * @throws IntakeFault continuation 인자를 해석할 수 없는 경우
         */
        std::optional<std::string> OnResume(
            const host::ContinuationToken& token,
            const std::string& args,
            const std::optional<std::string>& resume_payload);

    private:
        host::IHostEnvironment& host;
        RequestRegistry& registry;
        Gas resume_gas;
    };
}
