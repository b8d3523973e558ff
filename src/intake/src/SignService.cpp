// src/intake/src/SignService.cpp
#include "intake/include/SignService.hpp"
#include "common/utils/logger/Logger.hpp"
#include "protocols/sign/include/SignatureRequest.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace chainsig::intake
{
    using protocol::sign::ArgsParseResult;
    using protocol::sign::FailureReason;
    using protocol::sign::SignatureRequest;
    using protocol::sign::SignatureResponse;
    using protocol::sign::SignOutcome;
    using protocol::sign::SignRequestArgs;

    SignService::SignService(host::IHostEnvironment& host, const keys::IDomainKeyService& key_service, IntakeSettings settings)
        : host(host)
        , key_service(key_service)
        , settings(std::move(settings))
        , fee_policy(CreateFeePolicy(this->settings))
        , validator(key_service, this->settings.gas_for_sign_call)
        , fee_collector(host, *fee_policy)
        , bridge(host, registry, this->settings.resume_call_gas)
    {
        this->settings.Validate();

        host.AttachParticipant(&registry);
        host.RegisterEntryPoint(ContinuationBridge::RESUME_ENTRY_POINT,
            [this](const host::ContinuationToken& token, const std::string& args, const std::optional<std::string>& payload) {
                return bridge.OnResume(token, args, payload);
            });

        LOG_INFOF("SignService", "Ready (fee policy: %s, min deposit: %llu, gas for sign call: %llu)",
            fee_policy->Name(),
            static_cast<unsigned long long>(this->settings.min_deposit),
            static_cast<unsigned long long>(this->settings.gas_for_sign_call));
    }

    SignService::~SignService()
    {
        host.UnregisterEntryPoint(ContinuationBridge::RESUME_ENTRY_POINT);
        host.DetachParticipant(&registry);
    }

    SignResult SignService::Sign(const SignRequestArgs& args)
    {
        AccountId predecessor = host.PredecessorAccountId();

        LOG_INFOF("SignService", "sign: predecessor=%s, request=%s", predecessor.c_str(), args.ToJson().c_str());

        if (!protocol::sign::IsValidAccountId(predecessor)) {
            return SignResult::Rejected(SignError::MALFORMED_REQUEST, "Invalid predecessor account id: " + predecessor);
        }

        bool blank_path = std::all_of(args.path.begin(), args.path.end(),
            [](unsigned char c) { return std::isspace(c) != 0; });
        if (blank_path) {
            return SignResult::Rejected(SignError::MALFORMED_REQUEST, ToString(ArgsParseResult::INVALID_PATH));
        }

        ValidationResult validation = validator.Validate(args.domain_id, args.payload, host.PrepaidGas());
        if (!validation.IsValid()) {
            LOG_INFOF("SignService", "sign rejected: %s: %s", ToString(validation.error), validation.message.c_str());
            return SignResult::Rejected(validation.error, validation.message);
        }

        FeeReceipt receipt = fee_collector.Collect(host.AttachedDeposit(), predecessor, registry.Size());
        if (!receipt.IsAccepted()) {
            LOG_INFOF("SignService", "sign rejected: %s: %s", ToString(receipt.error), receipt.message.c_str());
            return SignResult::Rejected(receipt.error, receipt.message);
        }

        SignatureRequest request = SignatureRequest::Create(args.domain_id, args.payload, predecessor, args.path);

        // 시드는 fingerprint 에 섞지 않고 기록만 남김
        RandomSeed seed = host.RandomSeedArray();
        LOG_DEBUGF("SignService", "%s", json(seed).dump().c_str());

        SignResult result;
        result.token = bridge.Create(request);
        result.fingerprint = request.Fingerprint();
        result.refund = receipt.refund;
        return result;
    }

    SignResult SignService::SignJson(const std::string& json_args)
    {
        SignRequestArgs args;
        ArgsParseResult parsed = args.FromJson(json_args);

        switch (parsed) {
            case ArgsParseResult::OK:
                return Sign(args);
            case ArgsParseResult::INVALID_PAYLOAD:
                return SignResult::Rejected(SignError::INVALID_PAYLOAD, ToString(parsed));
            default:
                return SignResult::Rejected(SignError::MALFORMED_REQUEST, ToString(parsed));
        }
    }

    RespondStatus SignService::Respond(const SignatureRequest& request, const SignatureResponse& response)
    {
        LOG_INFOF("SignService", "respond: signer=%s, request=%s",
            host.PredecessorAccountId().c_str(), request.ToJson().dump().c_str());

        if (!response.IsWellFormed() || !response.MatchesPayload(request.payload.type)) {
            LOG_WARN("SignService", "Malformed signature response, resuming with failure");
            return bridge.Resume(request, SignOutcome::Failure(FailureReason::MALFORMED_RESULT));
        }

        return bridge.Resume(request, SignOutcome::Success(response));
    }

    std::optional<host::ContinuationToken> SignService::GetPendingRequest(const SignatureRequest& request) const
    {
        return registry.Get(request.Fingerprint());
    }

    keys::PublicKeyDescriptor SignService::PublicKey(std::optional<DomainId> domain_id) const
    {
        return key_service.GetPublicKey(domain_id.value_or(0));
    }

    std::optional<DomainId> SignService::LatestKeyVersion() const
    {
        return key_service.LatestDomainId();
    }
}
