// src/host/include/LocalHost.hpp
#pragma once
#include "host/include/IHostEnvironment.hpp"
#include "common/utils/queue/ThreadSafeQueue.hpp"
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace chainsig::host
{
    enum class ContinuationState : uint8_t
    {
        SUSPENDED = 0,
        RESUME_REQUESTED = 1,   // resume 큐에 들어감, 아직 callback 실행 전
        COMPLETED = 2           // callback 실행 완료 (재개 또는 타임아웃)
    };

    inline const char* ToString(ContinuationState state)
    {
        switch (state) {
            case ContinuationState::SUSPENDED: return "SUSPENDED";
            case ContinuationState::RESUME_REQUESTED: return "RESUME_REQUESTED";
            case ContinuationState::COMPLETED: return "COMPLETED";
            default: return "UNKNOWN";
        }
    }

    enum class DeliveryStatus : uint8_t
    {
        DELIVERED = 0,   // callback 이 값을 반환
        EMPTY = 1,       // callback 이 반환값 없이 끝남
        FAILED = 2       // callback 호출이 중단됨 (value 에 에러 메시지)
    };

    inline const char* ToString(DeliveryStatus status)
    {
        switch (status) {
            case DeliveryStatus::DELIVERED: return "DELIVERED";
            case DeliveryStatus::EMPTY: return "EMPTY";
            case DeliveryStatus::FAILED: return "FAILED";
            default: return "UNKNOWN";
        }
    }

    /**
     * @brief 원래 요청자에게 전달된 continuation 결과
     */
    struct Delivery
    {
        AccountId requester;
        DeliveryStatus status = DeliveryStatus::EMPTY;
        std::string value;
        bool timed_out = false;
    };

    struct Transfer
    {
        AccountId receiver;
        Balance amount = 0;
    };

    struct CallContext
    {
        AccountId predecessor;
        Balance attached_deposit = 0;
        Gas prepaid_gas = 0;
    };

    struct LocalHostOptions
    {
        AccountId account_id = "signer.local";
        BlockHeight yield_timeout_blocks = DEFAULT_YIELD_TIMEOUT_BLOCKS;
        BlockHeight initial_block_height = 1;
        RandomSeed base_seed{};
        size_t resume_queue_capacity = 10000;
    };

    /**
     * @brief 프로세스 내부 호스트 구현
     *
     * 동작 방식:
     * 1. Call() 로 호출 하나를 실행 (컨텍스트 설정 → 실행 → 성공 시 부수 효과 반영)
     * 2. 예외로 끝난 호출은 예약한 송금/continuation/resume 을 모두 버리고
     *    참여자(ICallParticipant)에게 롤백을 알린 뒤 예외를 다시 던짐
     * 3. 반영된 resume 은 큐에 쌓이고 ProcessResumptions() 에서 entry point 실행
     * 4. AdvanceBlocks() 는 블록 높이를 올리고 만료된 continuation 을 타임아웃으로 재개
     *
     * Call / ProcessResumptions / AdvanceBlocks 는 한 스레드에서만 호출해야 합니다.
     * 호출은 서로 겹치지 않으며 내부 락 없이 직렬화됩니다.
     */
    class LocalHost : public IHostEnvironment
    {
    public:
        explicit LocalHost(LocalHostOptions options = LocalHostOptions());
        ~LocalHost() override;

        LocalHost(const LocalHost&) = delete;
        LocalHost& operator=(const LocalHost&) = delete;

        // ========================================
        // IHostEnvironment
        // ========================================
        void RegisterEntryPoint(const std::string& name, EntryPoint entry_point) override;
        void UnregisterEntryPoint(const std::string& name) override;
        void AttachParticipant(ICallParticipant* participant) override;
        void DetachParticipant(ICallParticipant* participant) override;

        AccountId PredecessorAccountId() const override;
        Balance AttachedDeposit() const override;
        Gas PrepaidGas() const override;
        RandomSeed RandomSeedArray() const override;
        BlockHeight CurrentBlockHeight() const override;

        void ScheduleTransfer(const AccountId& receiver, Balance amount) override;

        std::optional<ContinuationToken> CreateContinuation(
            const std::string& entry_point,
            const std::string& args,
            Gas gas) override;

        ResumeResult ResumeContinuation(const ContinuationToken& token, const std::string& payload) override;

        // ========================================
        // 호출 실행
        // ========================================

        /**
         * @brief 호출 하나를 all-or-nothing 으로 실행
         * @throws fn 이 던진 예외 (부수 효과는 모두 버려진 상태)
         */
        template<typename Fn>
        auto Call(const CallContext& context, Fn&& fn) -> decltype(fn())
        {
            BeginCall(context);
            try {
                if constexpr (std::is_void_v<decltype(fn())>) {
                    fn();
                    CommitCall();
                } else {
                    auto result = fn();
                    CommitCall();
                    return result;
                }
            } catch (...) {
                AbortCall();
                throw;
            }
        }

        /**
         * @brief 큐에 쌓인 resume 을 모두 처리
         * @return 실행된 callback 수
         */
        size_t ProcessResumptions();

        /**
         * @brief 블록 높이를 올리고 만료된 continuation 을 타임아웃으로 재개
         * @return 타임아웃으로 실행된 callback 수
         */
        size_t AdvanceBlocks(BlockHeight blocks);

        // ========================================
        // 조회
        // ========================================
        const AccountId& AccountIdOfHost() const { return options.account_id; }
        std::optional<ContinuationState> GetContinuationState(const ContinuationToken& token) const;
        size_t SuspendedCount() const;
        std::optional<Delivery> GetDelivery(const ContinuationToken& token) const;
        const std::vector<Transfer>& Transfers() const { return transfers; }
        size_t PendingResumeCount() const { return resume_queue.Size(); }

    private:
        struct ContinuationRecord
        {
            uint64_t index = 0;
            std::string entry_point;
            std::string args;
            Gas gas = 0;
            AccountId requester;
            BlockHeight created_at = 0;
            ContinuationState state = ContinuationState::SUSPENDED;
        };

        struct ResumeEvent
        {
            ContinuationToken token;
            std::optional<std::string> payload;
        };

        // 호출 중에만 유효한 상태
        struct ActiveCall
        {
            CallContext context;
            RandomSeed seed{};
            Gas reserved_gas = 0;
            std::vector<Transfer> staged_transfers;
            std::vector<std::pair<ContinuationToken, ContinuationRecord>> staged_continuations;
            std::vector<ResumeEvent> staged_resumes;
        };

        void BeginCall(const CallContext& context);
        void CommitCall();
        void AbortCall();

        const ActiveCall& RequireCall() const;
        ActiveCall& RequireCall();

        RandomSeed DeriveCallSeed() const;
        ContinuationToken DeriveToken(const RandomSeed& seed, uint64_t index) const;

        void RunCallback(const ContinuationToken& token, const std::optional<std::string>& payload);

        LocalHostOptions options;
        BlockHeight block_height;
        uint64_t call_counter = 0;
        uint64_t continuation_counter = 0;

        std::optional<ActiveCall> active_call;

        std::unordered_map<std::string, EntryPoint> entry_points;
        std::vector<ICallParticipant*> participants;

        std::unordered_map<ContinuationToken, ContinuationRecord, ContinuationTokenHasher> continuations;
        std::unordered_map<ContinuationToken, Delivery, ContinuationTokenHasher> deliveries;
        std::vector<Transfer> transfers;

        utils::ThreadSafeQueue<ResumeEvent> resume_queue;
    };
}
