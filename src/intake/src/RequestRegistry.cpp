// src/intake/src/RequestRegistry.cpp
#include "intake/include/RequestRegistry.hpp"
#include "common/utils/logger/Logger.hpp"

namespace chainsig::intake
{
    bool RequestRegistry::Insert(const CryptoHash& fingerprint, const host::ContinuationToken& token)
    {
        auto it = pending.find(fingerprint);
        if (it != pending.end()) {
            Record(fingerprint, it->second);
            it->second = token;
            return true;
        }

        Record(fingerprint, std::nullopt);
        pending.emplace(fingerprint, token);
        return false;
    }

    std::optional<host::ContinuationToken> RequestRegistry::Remove(const CryptoHash& fingerprint)
    {
        auto it = pending.find(fingerprint);
        if (it == pending.end()) {
            return std::nullopt;
        }

        host::ContinuationToken token = it->second;
        Record(fingerprint, token);
        pending.erase(it);
        return token;
    }

    std::optional<host::ContinuationToken> RequestRegistry::Get(const CryptoHash& fingerprint) const
    {
        auto it = pending.find(fingerprint);
        if (it == pending.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void RequestRegistry::Record(const CryptoHash& fingerprint, std::optional<host::ContinuationToken> previous)
    {
        if (in_call) {
            journal.push_back(UndoRecord{fingerprint, std::move(previous)});
        }
    }

    void RequestRegistry::OnCallBegin()
    {
        journal.clear();
        in_call = true;
    }

    void RequestRegistry::OnCallCommit()
    {
        journal.clear();
        in_call = false;
    }

    void RequestRegistry::OnCallAbort()
    {
        if (!journal.empty()) {
            LOG_DEBUGF("RequestRegistry", "Rolling back %zu change(s)", journal.size());
        }

        // 역순으로 되돌림
        for (auto it = journal.rbegin(); it != journal.rend(); ++it) {
            if (it->previous) {
                pending[it->fingerprint] = *it->previous;
            } else {
                pending.erase(it->fingerprint);
            }
        }

        journal.clear();
        in_call = false;
    }
}
