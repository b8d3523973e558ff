// src/protocols/sign/src/SignatureRequest.cpp
#include "protocols/sign/include/SignatureRequest.hpp"
#include "proto/intake/sign_request.pb.h"
#include "common/utils/crypto/CryptoUtils.hpp"
#include "common/utils/hex/HexUtils.hpp"
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace chainsig::protocol::sign
{
    bool IsValidAccountId(const AccountId& account_id)
    {
        if (account_id.size() < MIN_ACCOUNT_ID_LEN || account_id.size() > MAX_ACCOUNT_ID_LEN) {
            return false;
        }

        bool last_was_separator = true;
        for (unsigned char c : account_id) {
            if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
                last_was_separator = false;
            } else if (c == '.' || c == '-' || c == '_') {
                if (last_was_separator) {
                    return false;
                }
                last_was_separator = true;
            } else {
                return false;
            }
        }
        return !last_was_separator;
    }

    CryptoHash DeriveTweak(const AccountId& requester, const std::string& path)
    {
        if (!IsValidAccountId(requester)) {
            throw std::invalid_argument("Invalid requester account id: " + requester);
        }
        std::string derivation_path = std::string(TWEAK_DERIVATION_PREFIX) + requester + ACCOUNT_DATA_SEPARATOR + path;
        return utils::Sha3_256(derivation_path);
    }

    SignatureRequest SignatureRequest::Create(
        DomainId domain_id,
        Payload payload,
        const AccountId& requester,
        const std::string& path)
    {
        SignatureRequest request;
        request.domain_id = domain_id;
        request.tweak = DeriveTweak(requester, path);
        request.payload = std::move(payload);
        return request;
    }

    CryptoHash SignatureRequest::Fingerprint() const
    {
        std::vector<uint8_t> buffer;
        buffer.reserve(8 + tweak.size() + 1 + payload.bytes.size());

        for (int i = 0; i < 8; ++i) {
            buffer.push_back(static_cast<uint8_t>((domain_id >> (8 * i)) & 0xFF));
        }
        buffer.insert(buffer.end(), tweak.begin(), tweak.end());
        buffer.push_back(static_cast<uint8_t>(payload.type));
        buffer.insert(buffer.end(), payload.bytes.begin(), payload.bytes.end());

        return utils::Sha256(buffer);
    }

    std::string SignatureRequest::Serialize() const
    {
        proto::intake::PendingSignRequest message;
        message.set_domain_id(domain_id);
        message.set_tweak(tweak.data(), tweak.size());
        message.set_payload_kind(payload.IsEcdsa()
            ? proto::intake::PAYLOAD_ECDSA
            : proto::intake::PAYLOAD_EDDSA);
        message.set_payload(payload.bytes.data(), payload.bytes.size());

        std::string out;
        if (!message.SerializeToString(&out)) {
            throw std::runtime_error("Failed to serialize PendingSignRequest");
        }
        return out;
    }

    std::optional<SignatureRequest> SignatureRequest::Deserialize(const std::string& data)
    {
        proto::intake::PendingSignRequest message;
        if (!message.ParseFromString(data)) {
            return std::nullopt;
        }

        if (message.tweak().size() != CryptoHash().size()) {
            return std::nullopt;
        }

        std::vector<uint8_t> bytes(message.payload().begin(), message.payload().end());
        std::optional<Payload> payload;
        switch (message.payload_kind()) {
            case proto::intake::PAYLOAD_ECDSA:
                payload = Payload::Ecdsa(std::move(bytes));
                break;
            case proto::intake::PAYLOAD_EDDSA:
                payload = Payload::Eddsa(std::move(bytes));
                break;
            default:
                return std::nullopt;
        }

        if (!payload) {
            return std::nullopt;
        }

        SignatureRequest request;
        request.domain_id = message.domain_id();
        std::copy(message.tweak().begin(), message.tweak().end(), request.tweak.begin());
        request.payload = std::move(*payload);
        return request;
    }

    json SignatureRequest::ToJson() const
    {
        json j;
        j["domain_id"] = domain_id;
        j["tweak"] = utils::BytesToHex(tweak);
        j["payload"] = payload.ToJson();
        return j;
    }

    std::optional<SignatureRequest> SignatureRequest::FromJson(const json& j)
    {
        try {
            auto tweak = utils::HexToBytes(j.at("tweak").get<std::string>());
            auto payload = Payload::FromJson(j.at("payload"));
            if (!tweak || tweak->size() != CryptoHash().size() || !payload) {
                return std::nullopt;
            }

            SignatureRequest request;
            request.domain_id = j.at("domain_id").get<DomainId>();
            std::copy(tweak->begin(), tweak->end(), request.tweak.begin());
            request.payload = std::move(*payload);
            return request;

        } catch (const json::exception&) {
            return std::nullopt;
        }
    }
}
