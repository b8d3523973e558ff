// src/protocols/sign/src/Payload.cpp
#include "protocols/sign/include/Payload.hpp"
#include "common/utils/hex/HexUtils.hpp"

using json = nlohmann::json;

namespace chainsig::protocol::sign
{
    std::optional<Payload> Payload::Ecdsa(std::vector<uint8_t> hash)
    {
        if (hash.size() != ECDSA_PAYLOAD_SIZE) {
            return std::nullopt;
        }
        return Payload{PayloadType::ECDSA, std::move(hash)};
    }

    std::optional<Payload> Payload::Eddsa(std::vector<uint8_t> message)
    {
        if (message.size() < EDDSA_MIN_PAYLOAD_SIZE || message.size() > EDDSA_MAX_PAYLOAD_SIZE) {
            return std::nullopt;
        }
        return Payload{PayloadType::EDDSA, std::move(message)};
    }

    json Payload::ToJson() const
    {
        json j;
        j[PayloadTypeToString(type)] = utils::BytesToHex(bytes);
        return j;
    }

    std::optional<Payload> Payload::FromJson(const json& j)
    {
        if (!j.is_object() || j.size() != 1) {
            return std::nullopt;
        }

        if (j.contains("Ecdsa") && j["Ecdsa"].is_string()) {
            auto bytes = utils::HexToBytes(j["Ecdsa"].get<std::string>());
            return bytes ? Ecdsa(std::move(*bytes)) : std::nullopt;
        }

        if (j.contains("Eddsa") && j["Eddsa"].is_string()) {
            auto bytes = utils::HexToBytes(j["Eddsa"].get<std::string>());
            return bytes ? Eddsa(std::move(*bytes)) : std::nullopt;
        }

        return std::nullopt;
    }
}
