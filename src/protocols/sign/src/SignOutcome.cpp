// src/protocols/sign/src/SignOutcome.cpp
#include "protocols/sign/include/SignOutcome.hpp"

using json = nlohmann::json;

namespace chainsig::protocol::sign
{
    std::string SignOutcome::Serialize() const
    {
        json j;
        if (signature) {
            j["Ok"] = signature->ToJson();
        } else {
            j["Err"] = ToString(reason);
        }
        return j.dump();
    }

    std::optional<SignOutcome> SignOutcome::Deserialize(const std::string& data)
    {
        json j = json::parse(data, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return std::nullopt;
        }

        if (j.contains("Ok")) {
            auto response = SignatureResponse::FromJson(j["Ok"]);
            if (!response) {
                return std::nullopt;
            }
            return Success(std::move(*response));
        }

        if (j.contains("Err") && j["Err"].is_string()) {
            std::string err = j["Err"].get<std::string>();
            if (err == ToString(FailureReason::TIMEOUT)) {
                return Failure(FailureReason::TIMEOUT);
            }
            if (err == ToString(FailureReason::MALFORMED_RESULT)) {
                return Failure(FailureReason::MALFORMED_RESULT);
            }
        }

        return std::nullopt;
    }
}
