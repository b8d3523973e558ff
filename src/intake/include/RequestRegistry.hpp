// src/intake/include/RequestRegistry.hpp
#pragma once
#include "host/include/ContinuationToken.hpp"
#include "host/include/ICallParticipant.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

namespace chainsig::intake
{
    /**
     * @brief 대기 중인 요청 테이블 (fingerprint → continuation token)
     *
     * fingerprint 하나에 항목은 최대 하나입니다. 같은 fingerprint 로 다시 넣으면
     * 기존 항목을 덮어쓰고, 덮어쓴 continuation 은 더 이상 참조되지 않습니다.
     *
     * 호출 도중의 변경은 undo 기록으로 남겨 두었다가 호출이 중단되면 되돌립니다.
     */
    class RequestRegistry : public host::ICallParticipant
    {
    public:
        /**
         * @return 기존 항목을 덮어썼으면 true
         */
        bool Insert(const CryptoHash& fingerprint, const host::ContinuationToken& token);

        std::optional<host::ContinuationToken> Remove(const CryptoHash& fingerprint);

        std::optional<host::ContinuationToken> Get(const CryptoHash& fingerprint) const;
        size_t Size() const { return pending.size(); }

        void OnCallBegin() override;
        void OnCallCommit() override;
        void OnCallAbort() override;

    private:
        struct UndoRecord
        {
            CryptoHash fingerprint;
            std::optional<host::ContinuationToken> previous;
        };

        void Record(const CryptoHash& fingerprint, std::optional<host::ContinuationToken> previous);

        std::unordered_map<CryptoHash, host::ContinuationToken, CryptoHashHasher> pending;
        std::vector<UndoRecord> journal;
        bool in_call = false;
    };
}
