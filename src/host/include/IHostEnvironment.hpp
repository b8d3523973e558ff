// src/host/include/IHostEnvironment.hpp
#pragma once
#include "host/include/ContinuationToken.hpp"
#include "host/include/ICallParticipant.hpp"
#include <functional>
#include <optional>
#include <string>

namespace chainsig::host
{
    enum class ResumeResult : uint8_t
    {
        ACCEPTED = 0,
        NOT_SUSPENDED = 1,   // 없는 토큰, 이미 재개 요청됨, 또는 완료됨
        QUEUE_FULL = 2       // resume 큐에 자리가 없음 (continuation 은 그대로 suspend)
    };

    inline const char* ToString(ResumeResult result)
    {
        switch (result) {
            case ResumeResult::ACCEPTED: return "ACCEPTED";
            case ResumeResult::NOT_SUSPENDED: return "NOT_SUSPENDED";
            case ResumeResult::QUEUE_FULL: return "QUEUE_FULL";
            default: return "UNKNOWN";
        }
    }

    /**
     * @brief 결정적 상태 머신 호스트 인터페이스
     *
     * 현재 호출의 컨텍스트(요청자, 예치금, 선불 가스, 랜덤 시드)와
     * 호출 종료 후 적용되는 부수 효과(송금 예약, continuation 생성/재개)를 제공합니다.
     * 호출 단위 all-or-nothing 은 구현체가 보장해야 합니다.
     */
    class IHostEnvironment
    {
    public:
        /**
         * @brief continuation 재개 시 호출되는 entry point
         *
         * resume_payload 가 nullopt 이면 타임아웃으로 재개된 것입니다.
         * 반환값은 원래 요청자의 컨텍스트로 전달됩니다 (nullopt 이면 전달할 값 없음).
         */
        using EntryPoint = std::function<std::optional<std::string>(
            const ContinuationToken& token,
            const std::string& args,
            const std::optional<std::string>& resume_payload)>;

        virtual ~IHostEnvironment() = default;

        // ========================================
        // 등록
        // 등록한 쪽이 먼저 소멸하면 소멸 전에 해제해야 함
        // ========================================
        virtual void RegisterEntryPoint(const std::string& name, EntryPoint entry_point) = 0;
        virtual void UnregisterEntryPoint(const std::string& name) = 0;
        virtual void AttachParticipant(ICallParticipant* participant) = 0;
        virtual void DetachParticipant(ICallParticipant* participant) = 0;

        // ========================================
        // 현재 호출 컨텍스트
        // ========================================
        virtual AccountId PredecessorAccountId() const = 0;
        virtual Balance AttachedDeposit() const = 0;
        virtual Gas PrepaidGas() const = 0;
        virtual RandomSeed RandomSeedArray() const = 0;
        virtual BlockHeight CurrentBlockHeight() const = 0;

        // ========================================
        // 부수 효과
        // ========================================

        /**
         * @brief 송금 예약 (fire-and-forget, 실패는 호스트 책임)
         */
        virtual void ScheduleTransfer(const AccountId& receiver, Balance amount) = 0;

        /**
         * @brief 고정 entry point 에 묶인 continuation 생성
         *
         * @param entry_point 재개 시 호출될 entry point 이름
         * @param args 재개 시 그대로 전달되는 인자
         * @param gas 재개 callback 에 예약할 가스
         * @return 같은 호출 안에서 결정적으로 발급된 토큰 (할당 실패 시 nullopt)
         */
        virtual std::optional<ContinuationToken> CreateContinuation(
            const std::string& entry_point,
            const std::string& args,
            Gas gas) = 0;

        /**
         * @brief suspend 상태의 continuation 재개 요청
         *
         * ACCEPTED 를 받은 재개는 호출이 성공하면 반드시 실행됩니다.
         */
        virtual ResumeResult ResumeContinuation(const ContinuationToken& token, const std::string& payload) = 0;
    };
}
