// src/intake/src/ContinuationBridge.cpp
#include "intake/include/ContinuationBridge.hpp"
#include "common/utils/logger/Logger.hpp"
#include "common/utils/hex/HexUtils.hpp"

namespace chainsig::intake
{
    using protocol::sign::FailureReason;
    using protocol::sign::SignatureRequest;
    using protocol::sign::SignOutcome;

    ContinuationBridge::ContinuationBridge(host::IHostEnvironment& host, RequestRegistry& registry, Gas resume_gas)
        : host(host), registry(registry), resume_gas(resume_gas)
    {
    }

    host::ContinuationToken ContinuationBridge::Create(const SignatureRequest& request)
    {
        std::optional<host::ContinuationToken> token = host.CreateContinuation(
            RESUME_ENTRY_POINT, request.Serialize(), resume_gas);

        if (!token) {
            throw IntakeFault("continuation allocation returned no token");
        }

        if (registry.Insert(request.Fingerprint(), *token)) {
            LOG_WARN("ContinuationBridge", "request already present, overriding callback.");
        }

        LOG_DEBUGF("ContinuationBridge", "Suspended request %s with token %s",
            utils::BytesToHex(request.Fingerprint()).c_str(), token->ToHex().c_str());
        return *token;
    }

    RespondStatus ContinuationBridge::Resume(const SignatureRequest& request, const SignOutcome& outcome)
    {
        std::optional<host::ContinuationToken> token = registry.Get(request.Fingerprint());
        if (!token) {
            return RespondStatus::REQUEST_NOT_FOUND;
        }

        switch (host.ResumeContinuation(*token, outcome.Serialize())) {
            case host::ResumeResult::ACCEPTED:
                break;
            case host::ResumeResult::QUEUE_FULL:
                LOG_WARNF("ContinuationBridge", "Resume queue full, continuation %s stays suspended",
                    token->ToHex().c_str());
                return RespondStatus::RESUME_QUEUE_FULL;
            default:
                LOG_WARNF("ContinuationBridge", "Continuation %s was already resolved", token->ToHex().c_str());
                return RespondStatus::ALREADY_RESOLVED;
        }

        return outcome.IsSuccess() ? RespondStatus::RESUMED : RespondStatus::RESUMED_MALFORMED;
    }

    std::optional<SignOutcome> ContinuationBridge::Finalize(
        const host::ContinuationToken& token,
        const SignatureRequest& request,
        const SignOutcome& outcome)
    {
        CryptoHash fingerprint = request.Fingerprint();

        std::optional<host::ContinuationToken> current = registry.Get(fingerprint);
        if (!current) {
            LOG_WARNF("ContinuationBridge", "No pending entry for token %s, nothing to clean",
                token.ToHex().c_str());
            return std::nullopt;
        }

        if (*current != token) {
            // 같은 요청이 다시 들어와 더 새로운 continuation 이 항목을 차지함
            LOG_WARNF("ContinuationBridge", "Token %s was superseded by %s, nothing to clean",
                token.ToHex().c_str(), current->ToHex().c_str());
            return std::nullopt;
        }

        registry.Remove(fingerprint);

        if (outcome.IsSuccess()) {
            LOG_INFOF("ContinuationBridge", "Delivered signature for %s", utils::BytesToHex(fingerprint).c_str());
        } else {
            LOG_WARNF("ContinuationBridge", "Request %s failed: %s",
                utils::BytesToHex(fingerprint).c_str(), ToString(outcome.reason));
        }

        return outcome;
    }

    std::optional<std::string> ContinuationBridge::OnResume(
        const host::ContinuationToken& token,
        const std::string& args,
        const std::optional<std::string>& resume_payload)
    {
        std::optional<SignatureRequest> request = SignatureRequest::Deserialize(args);
        if (!request) {
            throw IntakeFault("cannot decode continuation arguments for token " + token.ToHex());
        }

        SignOutcome outcome = SignOutcome::Failure(FailureReason::TIMEOUT);
        if (resume_payload) {
            std::optional<SignOutcome> decoded = SignOutcome::Deserialize(*resume_payload);
            if (decoded) {
                outcome = std::move(*decoded);
            } else {
                LOG_ERRORF("ContinuationBridge", "Undecodable resume payload for token %s", token.ToHex().c_str());
                outcome = SignOutcome::Failure(FailureReason::MALFORMED_RESULT);
            }
        }

        std::optional<SignOutcome> delivered = Finalize(token, *request, outcome);
        if (!delivered) {
            return std::nullopt;
        }
        return delivered->Serialize();
    }
}
