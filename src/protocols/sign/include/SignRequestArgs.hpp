// src/protocols/sign/include/SignRequestArgs.hpp
#pragma once
#include "protocols/sign/include/Payload.hpp"
#include <string>

namespace chainsig::protocol::sign
{
    enum class ArgsParseResult : uint8_t
    {
        OK = 0,
        MALFORMED_JSON = 1,
        INVALID_DOMAIN_ID = 2,
        INVALID_PATH = 3,
        INVALID_PAYLOAD = 4
    };

    inline const char* ToString(ArgsParseResult result)
    {
        switch (result) {
            case ArgsParseResult::OK: return "OK";
            case ArgsParseResult::MALFORMED_JSON: return "Malformed JSON arguments";
            case ArgsParseResult::INVALID_DOMAIN_ID: return "Invalid domain_id";
            case ArgsParseResult::INVALID_PATH: return "Path is required and cannot be empty";
            case ArgsParseResult::INVALID_PAYLOAD: return "Invalid payload_v2";
            default: return "Unknown error";
        }
    }

    /**
     * @brief sign 호출 인자
     *
     * JSON: {"request": {"domain_id": 0, "path": "...", "payload_v2": {"Ecdsa": "<hex>"}}}
     * "request" 래퍼 없이 안쪽 객체만 와도 허용
     */
    struct SignRequestArgs
    {
        DomainId domain_id = 0;
        std::string path;
        Payload payload;

        std::string ToJson() const;
        ArgsParseResult FromJson(const std::string& json_str);
    };
}
