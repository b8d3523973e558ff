// src/protocols/sign/src/SignRequestArgs.cpp
#include "protocols/sign/include/SignRequestArgs.hpp"
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace chainsig::protocol::sign
{
    std::string SignRequestArgs::ToJson() const
    {
        json request;
        request["domain_id"] = domain_id;
        request["path"] = path;
        request["payload_v2"] = payload.ToJson();

        json j;
        j["request"] = request;
        return j.dump();
    }

    ArgsParseResult SignRequestArgs::FromJson(const std::string& json_str)
    {
        json j = json::parse(json_str, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return ArgsParseResult::MALFORMED_JSON;
        }

        const json& request = j.contains("request") ? j["request"] : j;
        if (!request.is_object()) {
            return ArgsParseResult::MALFORMED_JSON;
        }

        // domain_id 생략 시 0
        if (request.contains("domain_id")) {
            if (!request["domain_id"].is_number_unsigned()) {
                return ArgsParseResult::INVALID_DOMAIN_ID;
            }
            domain_id = request["domain_id"].get<DomainId>();
        } else {
            domain_id = 0;
        }

        if (!request.contains("path") || !request["path"].is_string()) {
            return ArgsParseResult::INVALID_PATH;
        }
        path = request["path"].get<std::string>();
        if (std::all_of(path.begin(), path.end(), [](unsigned char c) { return std::isspace(c); })) {
            return ArgsParseResult::INVALID_PATH;
        }

        if (!request.contains("payload_v2")) {
            return ArgsParseResult::INVALID_PAYLOAD;
        }
        auto parsed = Payload::FromJson(request["payload_v2"]);
        if (!parsed) {
            return ArgsParseResult::INVALID_PAYLOAD;
        }
        payload = std::move(*parsed);

        return ArgsParseResult::OK;
    }
}
