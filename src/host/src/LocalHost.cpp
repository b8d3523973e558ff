// src/host/src/LocalHost.cpp
#include "host/include/LocalHost.hpp"
#include "common/utils/crypto/CryptoUtils.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>

namespace chainsig::host
{
    namespace
    {
        void AppendLe64(std::vector<uint8_t>& buffer, uint64_t value)
        {
            for (int i = 0; i < 8; ++i) {
                buffer.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
            }
        }
    }

    LocalHost::LocalHost(LocalHostOptions options)
        : options(std::move(options))
        , block_height(this->options.initial_block_height)
        , resume_queue(this->options.resume_queue_capacity)
    {
        LOG_INFOF("LocalHost", "Created host %s (yield timeout: %llu blocks, height: %llu)",
            this->options.account_id.c_str(),
            static_cast<unsigned long long>(this->options.yield_timeout_blocks),
            static_cast<unsigned long long>(block_height));
    }

    LocalHost::~LocalHost()
    {
        resume_queue.Shutdown();
    }

    void LocalHost::RegisterEntryPoint(const std::string& name, EntryPoint entry_point)
    {
        if (!entry_point) {
            throw std::invalid_argument("Entry point must be callable: " + name);
        }
        if (entry_points.count(name) > 0) {
            LOG_WARNF("LocalHost", "Replacing entry point: %s", name.c_str());
        }
        entry_points[name] = std::move(entry_point);
    }

    void LocalHost::UnregisterEntryPoint(const std::string& name)
    {
        if (entry_points.erase(name) > 0) {
            LOG_DEBUGF("LocalHost", "Unregistered entry point: %s", name.c_str());
        }
    }

    void LocalHost::AttachParticipant(ICallParticipant* participant)
    {
        if (!participant) {
            throw std::invalid_argument("Call participant must not be null");
        }
        if (std::find(participants.begin(), participants.end(), participant) == participants.end()) {
            participants.push_back(participant);
        }
    }

    void LocalHost::DetachParticipant(ICallParticipant* participant)
    {
        if (active_call) {
            LOG_WARN("LocalHost", "Call participant detached inside a host call, it will not see the call end");
        }
        participants.erase(std::remove(participants.begin(), participants.end(), participant), participants.end());
    }

    // ========================================
    // 호출 컨텍스트
    // ========================================

    const LocalHost::ActiveCall& LocalHost::RequireCall() const
    {
        if (!active_call) {
            throw std::logic_error("No active host call");
        }
        return *active_call;
    }

    LocalHost::ActiveCall& LocalHost::RequireCall()
    {
        if (!active_call) {
            throw std::logic_error("No active host call");
        }
        return *active_call;
    }

    AccountId LocalHost::PredecessorAccountId() const
    {
        return RequireCall().context.predecessor;
    }

    Balance LocalHost::AttachedDeposit() const
    {
        return RequireCall().context.attached_deposit;
    }

    Gas LocalHost::PrepaidGas() const
    {
        return RequireCall().context.prepaid_gas;
    }

    RandomSeed LocalHost::RandomSeedArray() const
    {
        return RequireCall().seed;
    }

    BlockHeight LocalHost::CurrentBlockHeight() const
    {
        return block_height;
    }

    RandomSeed LocalHost::DeriveCallSeed() const
    {
        std::vector<uint8_t> buffer(options.base_seed.begin(), options.base_seed.end());
        AppendLe64(buffer, block_height);
        AppendLe64(buffer, call_counter);
        return utils::Sha256(buffer);
    }

    ContinuationToken LocalHost::DeriveToken(const RandomSeed& seed, uint64_t index) const
    {
        std::vector<uint8_t> buffer(seed.begin(), seed.end());
        AppendLe64(buffer, index);
        return ContinuationToken{utils::Sha256(buffer)};
    }

    // ========================================
    // 부수 효과 (호출이 성공해야 반영)
    // ========================================

    void LocalHost::ScheduleTransfer(const AccountId& receiver, Balance amount)
    {
        RequireCall().staged_transfers.push_back(Transfer{receiver, amount});
    }

    std::optional<ContinuationToken> LocalHost::CreateContinuation(
        const std::string& entry_point,
        const std::string& args,
        Gas gas)
    {
        ActiveCall& call = RequireCall();

        if (entry_points.count(entry_point) == 0) {
            LOG_ERRORF("LocalHost", "Unknown entry point: %s", entry_point.c_str());
            return std::nullopt;
        }

        if (call.reserved_gas + gas > call.context.prepaid_gas) {
            LOG_ERRORF("LocalHost", "Not enough prepaid gas to reserve %llu (reserved: %llu, prepaid: %llu)",
                static_cast<unsigned long long>(gas),
                static_cast<unsigned long long>(call.reserved_gas),
                static_cast<unsigned long long>(call.context.prepaid_gas));
            return std::nullopt;
        }

        uint64_t index = continuation_counter + call.staged_continuations.size();
        ContinuationToken token = DeriveToken(call.seed, index);

        ContinuationRecord record;
        record.index = index;
        record.entry_point = entry_point;
        record.args = args;
        record.gas = gas;
        record.requester = call.context.predecessor;
        record.created_at = block_height;

        call.reserved_gas += gas;
        call.staged_continuations.emplace_back(token, std::move(record));
        return token;
    }

    ResumeResult LocalHost::ResumeContinuation(const ContinuationToken& token, const std::string& payload)
    {
        ActiveCall& call = RequireCall();

        auto it = continuations.find(token);
        if (it == continuations.end() || it->second.state != ContinuationState::SUSPENDED) {
            return ResumeResult::NOT_SUSPENDED;
        }

        bool already_staged = std::any_of(call.staged_resumes.begin(), call.staged_resumes.end(),
            [&token](const ResumeEvent& event) { return event.token == token; });
        if (already_staged) {
            return ResumeResult::NOT_SUSPENDED;
        }

        // 커밋 시 Push 가 실패하지 않도록 자리를 미리 확인
        if (resume_queue.Size() + call.staged_resumes.size() >= resume_queue.Capacity()) {
            LOG_WARNF("LocalHost", "Resume queue is full (%zu), cannot resume %s",
                resume_queue.Capacity(), token.ToHex().c_str());
            return ResumeResult::QUEUE_FULL;
        }

        call.staged_resumes.push_back(ResumeEvent{token, payload});
        return ResumeResult::ACCEPTED;
    }

    // ========================================
    // 호출 경계
    // ========================================

    void LocalHost::BeginCall(const CallContext& context)
    {
        if (active_call) {
            throw std::logic_error("Nested host calls are not supported");
        }

        ++call_counter;
        active_call.emplace();
        active_call->context = context;
        active_call->seed = DeriveCallSeed();

        for (ICallParticipant* participant : participants) {
            participant->OnCallBegin();
        }
    }

    void LocalHost::CommitCall()
    {
        ActiveCall& call = *active_call;

        for (ICallParticipant* participant : participants) {
            participant->OnCallCommit();
        }

        for (auto& transfer : call.staged_transfers) {
            LOG_INFOF("LocalHost", "Transfer %llu to %s",
                static_cast<unsigned long long>(transfer.amount), transfer.receiver.c_str());
            transfers.push_back(std::move(transfer));
        }

        continuation_counter += call.staged_continuations.size();
        for (auto& [token, record] : call.staged_continuations) {
            LOG_DEBUGF("LocalHost", "Continuation %s suspended at height %llu",
                token.ToHex().c_str(), static_cast<unsigned long long>(record.created_at));
            continuations[token] = std::move(record);
        }

        for (auto& event : call.staged_resumes) {
            ContinuationToken token = event.token;
            utils::QueueResult result = resume_queue.Push(std::move(event));
            if (result != utils::QueueResult::SUCCESS) {
                // 자리는 ResumeContinuation 에서 확인했으므로 종료 중일 때만 발생
                LOG_ERRORF("LocalHost", "Failed to enqueue resume for %s: %s",
                    token.ToHex().c_str(), utils::ToString(result));
                continue;
            }
            continuations[token].state = ContinuationState::RESUME_REQUESTED;
        }

        active_call.reset();
    }

    void LocalHost::AbortCall()
    {
        if (!active_call) {
            return;
        }

        const ActiveCall& call = *active_call;
        LOG_WARNF("LocalHost", "Call aborted, discarding %zu transfer(s), %zu continuation(s), %zu resume(s)",
            call.staged_transfers.size(), call.staged_continuations.size(), call.staged_resumes.size());

        active_call.reset();

        for (ICallParticipant* participant : participants) {
            participant->OnCallAbort();
        }
    }

    // ========================================
    // 재개 처리
    // ========================================

    void LocalHost::RunCallback(const ContinuationToken& token, const std::optional<std::string>& payload)
    {
        auto it = continuations.find(token);
        if (it == continuations.end() || it->second.state == ContinuationState::COMPLETED) {
            LOG_WARNF("LocalHost", "Skipping resume of inactive continuation %s", token.ToHex().c_str());
            return;
        }

        // callback 이 새 continuation 을 만들 수 있으므로 레코드는 복사해서 사용
        it->second.state = ContinuationState::COMPLETED;
        const ContinuationRecord record = it->second;

        Delivery delivery;
        delivery.requester = record.requester;
        delivery.timed_out = !payload.has_value();

        auto entry = entry_points.find(record.entry_point);
        if (entry == entry_points.end()) {
            delivery.status = DeliveryStatus::FAILED;
            delivery.value = "Entry point not registered: " + record.entry_point;
            LOG_ERRORF("LocalHost", "%s", delivery.value.c_str());
            deliveries[token] = std::move(delivery);
            return;
        }

        CallContext context;
        context.predecessor = options.account_id;
        context.attached_deposit = 0;
        context.prepaid_gas = record.gas;

        try {
            std::optional<std::string> result = Call(context, [&]() {
                return entry->second(token, record.args, payload);
            });

            if (result) {
                delivery.status = DeliveryStatus::DELIVERED;
                delivery.value = std::move(*result);
            } else {
                delivery.status = DeliveryStatus::EMPTY;
            }

        } catch (const std::exception& e) {
            delivery.status = DeliveryStatus::FAILED;
            delivery.value = e.what();
            LOG_ERRORF("LocalHost", "Callback %s for %s failed: %s",
                record.entry_point.c_str(), token.ToHex().c_str(), e.what());
        }

        LOG_DEBUGF("LocalHost", "Delivery for %s to %s: %s",
            token.ToHex().c_str(), delivery.requester.c_str(), ToString(delivery.status));
        deliveries[token] = std::move(delivery);
    }

    size_t LocalHost::ProcessResumptions()
    {
        if (active_call) {
            throw std::logic_error("Cannot process resumptions inside a host call");
        }

        std::vector<ResumeEvent> events;
        resume_queue.Drain(events);

        for (const auto& event : events) {
            RunCallback(event.token, event.payload);
        }
        return events.size();
    }

    size_t LocalHost::AdvanceBlocks(BlockHeight blocks)
    {
        if (active_call) {
            throw std::logic_error("Cannot advance blocks inside a host call");
        }

        block_height += blocks;

        std::vector<std::pair<uint64_t, ContinuationToken>> expired;
        for (const auto& [token, record] : continuations) {
            if (record.state == ContinuationState::SUSPENDED &&
                block_height >= record.created_at + options.yield_timeout_blocks) {
                expired.emplace_back(record.index, token);
            }
        }

        // 생성 순서대로 타임아웃 처리
        std::sort(expired.begin(), expired.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

        for (const auto& [index, token] : expired) {
            LOG_INFOF("LocalHost", "Continuation %s timed out at height %llu",
                token.ToHex().c_str(), static_cast<unsigned long long>(block_height));
            RunCallback(token, std::nullopt);
        }
        return expired.size();
    }

    // ========================================
    // 조회
    // ========================================

    std::optional<ContinuationState> LocalHost::GetContinuationState(const ContinuationToken& token) const
    {
        auto it = continuations.find(token);
        if (it == continuations.end()) {
            return std::nullopt;
        }
        return it->second.state;
    }

    size_t LocalHost::SuspendedCount() const
    {
        return static_cast<size_t>(std::count_if(continuations.begin(), continuations.end(),
            [](const auto& entry) { return entry.second.state != ContinuationState::COMPLETED; }));
    }

    std::optional<Delivery> LocalHost::GetDelivery(const ContinuationToken& token) const
    {
        auto it = deliveries.find(token);
        if (it == deliveries.end()) {
            return std::nullopt;
        }
        return it->second;
    }
}
