// src/protocols/sign/src/SignatureResponse.cpp
#include "protocols/sign/include/SignatureResponse.hpp"
#include "common/utils/crypto/CryptoUtils.hpp"
#include "common/utils/hex/HexUtils.hpp"

using json = nlohmann::json;

namespace chainsig::protocol::sign
{
    SignatureResponse SignatureResponse::Secp256k1(std::vector<uint8_t> big_r, std::vector<uint8_t> s, uint8_t recovery_id)
    {
        SignatureResponse response;
        response.scheme = SignatureScheme::SECP256K1;
        response.big_r = std::move(big_r);
        response.s = std::move(s);
        response.recovery_id = recovery_id;
        return response;
    }

    SignatureResponse SignatureResponse::Ed25519(std::vector<uint8_t> signature)
    {
        SignatureResponse response;
        response.scheme = SignatureScheme::ED25519;
        response.signature = std::move(signature);
        return response;
    }

    bool SignatureResponse::IsWellFormed() const
    {
        switch (scheme) {
            case SignatureScheme::SECP256K1:
                return big_r.size() == SECP256K1_BIG_R_SIZE &&
                       (big_r[0] == 0x02 || big_r[0] == 0x03) &&
                       s.size() == SECP256K1_SCALAR_SIZE &&
                       utils::IsValidSecp256k1Scalar(s.data()) &&
                       recovery_id <= SECP256K1_MAX_RECOVERY_ID &&
                       signature.empty();
            case SignatureScheme::ED25519:
                return signature.size() == ED25519_SIGNATURE_SIZE && big_r.empty() && s.empty();
            default:
                return false;
        }
    }

    bool SignatureResponse::MatchesPayload(PayloadType type) const
    {
        return (scheme == SignatureScheme::SECP256K1 && type == PayloadType::ECDSA) ||
               (scheme == SignatureScheme::ED25519 && type == PayloadType::EDDSA);
    }

    json SignatureResponse::ToJson() const
    {
        json j;
        if (scheme == SignatureScheme::SECP256K1) {
            j["scheme"] = "Secp256k1";
            j["big_r"] = {{"affine_point", utils::BytesToHex(big_r)}};
            j["s"] = {{"scalar", utils::BytesToHex(s)}};
            j["recovery_id"] = recovery_id;
        } else {
            j["scheme"] = "Ed25519";
            j["signature"] = signature;
        }
        return j;
    }

    std::optional<SignatureResponse> SignatureResponse::FromJson(const json& j)
    {
        try {
            std::string scheme_name = j.at("scheme").get<std::string>();

            if (scheme_name == "Secp256k1") {
                auto big_r = utils::HexToBytes(j.at("big_r").at("affine_point").get<std::string>());
                auto s = utils::HexToBytes(j.at("s").at("scalar").get<std::string>());
                uint32_t recovery_id = j.at("recovery_id").get<uint32_t>();
                if (!big_r || !s || recovery_id > 0xFF) {
                    return std::nullopt;
                }
                return Secp256k1(std::move(*big_r), std::move(*s), static_cast<uint8_t>(recovery_id));
            }

            if (scheme_name == "Ed25519") {
                std::vector<uint8_t> signature;
                for (const auto& value : j.at("signature")) {
                    uint32_t byte = value.get<uint32_t>();
                    if (byte > 0xFF) {
                        return std::nullopt;
                    }
                    signature.push_back(static_cast<uint8_t>(byte));
                }
                return Ed25519(std::move(signature));
            }

            return std::nullopt;

        } catch (const json::exception&) {
            return std::nullopt;
        }
    }
}
