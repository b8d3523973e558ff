// src/service/IntakeCommandHandler.cpp
#include "service/IntakeCommandHandler.hpp"
#include "common/keys/include/KeyServiceException.hpp"
#include "common/utils/hex/HexUtils.hpp"
#include "common/utils/logger/Logger.hpp"

using json = nlohmann::json;

namespace chainsig::service
{
    using protocol::sign::SignatureRequest;
    using protocol::sign::SignatureResponse;

    IntakeCommandHandler::IntakeCommandHandler(host::LocalHost& host, intake::SignService& service)
        : host(host), service(service)
    {
    }

    json IntakeCommandHandler::Error(const std::string& error, const std::string& message)
    {
        return json{{"ok", false}, {"error", error}, {"message", message}};
    }

    std::string IntakeCommandHandler::HandleLine(const std::string& line)
    {
        json command = json::parse(line, nullptr, false);
        if (command.is_discarded() || !command.is_object()) {
            return Error("MalformedCommand", "Command must be a JSON object").dump();
        }
        return Handle(command).dump();
    }

    json IntakeCommandHandler::Handle(const json& command)
    {
        std::string cmd = command.value("cmd", "");

        try {
            if (cmd == "sign") return HandleSign(command);
            if (cmd == "respond") return HandleRespond(command);
            if (cmd == "advance") return HandleAdvance(command);
            if (cmd == "pending") return HandlePending(command);
            if (cmd == "delivery") return HandleDelivery(command);
            if (cmd == "public_key") return HandlePublicKey(command);
            if (cmd == "latest_key_version") return HandleLatestKeyVersion();

            return Error("UnknownCommand", "Unknown command: " + cmd);

        } catch (const json::exception& e) {
            return Error("MalformedCommand", e.what());
        } catch (const intake::IntakeFault& e) {
            // 호출은 이미 롤백됨
            LOG_ERRORF("IntakeCommandHandler", "%s aborted: %s", cmd.c_str(), e.what());
            return Error("CallAborted", e.what());
        } catch (const keys::KeyServiceException& e) {
            LOG_ERRORF("IntakeCommandHandler", "%s key service error: %s", cmd.c_str(), e.what());
            return Error("KeyServiceError", e.what());
        } catch (const std::exception& e) {
            // 명령 하나의 실패로 루프가 끝나지 않도록 응답으로 돌려줌
            LOG_ERRORF("IntakeCommandHandler", "%s failed: %s", cmd.c_str(), e.what());
            return Error("InternalError", e.what());
        }
    }

    json IntakeCommandHandler::HandleSign(const json& command)
    {
        host::CallContext context;
        context.predecessor = command.at("caller").get<std::string>();
        context.attached_deposit = command.value("deposit", static_cast<Balance>(0));
        context.prepaid_gas = command.value("gas", static_cast<Gas>(0));

        std::string args = command.at("args").dump();

        intake::SignResult result = host.Call(context, [&]() {
            return service.SignJson(args);
        });

        if (!result.IsOk()) {
            return Error(intake::ToString(result.error), result.message);
        }

        return json{
            {"ok", true},
            {"token", result.token->ToHex()},
            {"fingerprint", utils::BytesToHex(result.fingerprint)},
            {"refund", result.refund}
        };
    }

    json IntakeCommandHandler::HandleRespond(const json& command)
    {
        std::optional<SignatureRequest> request = SignatureRequest::FromJson(command.at("request"));
        if (!request) {
            return Error("MalformedCommand", "Invalid request");
        }

        // 형식이 틀린 응답도 Respond 에서 MalformedResult 로 처리되도록 빈 응답으로 넘김
        SignatureResponse response;
        std::optional<SignatureResponse> parsed = SignatureResponse::FromJson(command.at("response"));
        if (parsed) {
            response = std::move(*parsed);
        } else {
            response.scheme = request->payload.IsEcdsa()
                ? protocol::sign::SignatureScheme::SECP256K1
                : protocol::sign::SignatureScheme::ED25519;
        }

        std::optional<host::ContinuationToken> token = service.GetPendingRequest(*request);

        host::CallContext context;
        context.predecessor = command.value("signer", std::string("mpc.local"));
        context.prepaid_gas = command.value("gas", static_cast<Gas>(0));

        intake::RespondStatus status = host.Call(context, [&]() {
            return service.Respond(*request, response);
        });

        host.ProcessResumptions();

        json out{{"ok", status == intake::RespondStatus::RESUMED || status == intake::RespondStatus::RESUMED_MALFORMED},
                 {"status", intake::ToString(status)}};

        if (token) {
            std::optional<host::Delivery> delivery = host.GetDelivery(*token);
            if (delivery) {
                out["delivery"] = {
                    {"requester", delivery->requester},
                    {"status", host::ToString(delivery->status)},
                    {"value", delivery->value}
                };
            }
        }
        return out;
    }

    json IntakeCommandHandler::HandleAdvance(const json& command)
    {
        BlockHeight blocks = command.value("blocks", static_cast<BlockHeight>(1));
        size_t resumed = host.ProcessResumptions();
        size_t timed_out = host.AdvanceBlocks(blocks);

        return json{
            {"ok", true},
            {"height", host.CurrentBlockHeight()},
            {"resumed", resumed},
            {"timed_out", timed_out}
        };
    }

    json IntakeCommandHandler::HandlePending(const json& command)
    {
        std::optional<SignatureRequest> request = SignatureRequest::FromJson(command.at("request"));
        if (!request) {
            return Error("MalformedCommand", "Invalid request");
        }

        std::optional<host::ContinuationToken> token = service.GetPendingRequest(*request);
        json out{{"ok", true}, {"token", nullptr}};
        if (token) {
            out["token"] = token->ToHex();
        }
        return out;
    }

    json IntakeCommandHandler::HandleDelivery(const json& command)
    {
        auto token = host::ContinuationToken::FromHex(command.at("token").get<std::string>());
        if (!token) {
            return Error("MalformedCommand", "Invalid token");
        }

        std::optional<host::Delivery> delivery = host.GetDelivery(*token);
        if (!delivery) {
            auto state = host.GetContinuationState(*token);
            return json{{"ok", true}, {"delivered", false},
                        {"state", state ? host::ToString(*state) : "UNKNOWN"}};
        }

        return json{
            {"ok", true},
            {"delivered", true},
            {"requester", delivery->requester},
            {"status", host::ToString(delivery->status)},
            {"timed_out", delivery->timed_out},
            {"value", delivery->value}
        };
    }

    json IntakeCommandHandler::HandlePublicKey(const json& command)
    {
        std::optional<DomainId> domain_id;
        if (command.contains("domain_id")) {
            domain_id = command.at("domain_id").get<DomainId>();
        }

        try {
            keys::PublicKeyDescriptor key = service.PublicKey(domain_id);
            return json{{"ok", true}, {"public_key", key.ToString()}};
        } catch (const keys::DomainNotFoundException& e) {
            return Error("DomainNotFound", e.what());
        }
    }

    json IntakeCommandHandler::HandleLatestKeyVersion()
    {
        std::optional<DomainId> latest = service.LatestKeyVersion();
        json out{{"ok", latest.has_value()}};
        if (latest) {
            out["latest_key_version"] = *latest;
        } else {
            out["error"] = "DomainNotFound";
        }
        return out;
    }
}
