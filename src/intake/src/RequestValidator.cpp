// src/intake/src/RequestValidator.cpp
#include "intake/include/RequestValidator.hpp"
#include "common/keys/include/KeyServiceException.hpp"
#include "common/utils/crypto/CryptoUtils.hpp"

namespace chainsig::intake
{
    namespace
    {
        ValidationResult Reject(SignError error, std::string message)
        {
            ValidationResult result;
            result.error = error;
            result.message = std::move(message);
            return result;
        }
    }

    RequestValidator::RequestValidator(const keys::IDomainKeyService& key_service, Gas required_gas)
        : key_service(key_service), required_gas(required_gas)
    {
    }

    ValidationResult RequestValidator::Validate(
        DomainId domain_id,
        const protocol::sign::Payload& payload,
        Gas reserved_gas) const
    {
        using protocol::sign::PayloadType;

        ValidationResult result;

        try {
            result.public_key = key_service.GetPublicKey(domain_id);
        } catch (const keys::DomainNotFoundException& e) {
            return Reject(SignError::DOMAIN_NOT_FOUND, e.what());
        } catch (const keys::KeyServiceException& e) {
            throw IntakeFault(std::string("Key lookup failed: ") + e.what());
        }

        switch (result.public_key.GetCurveType()) {
            case CurveType::SECP256K1:
                if (!payload.IsEcdsa()) {
                    return Reject(SignError::PAYLOAD_CURVE_MISMATCH,
                        std::string("Payload is not Ecdsa, found: ") + PayloadTypeToString(payload.type));
                }
                if (payload.bytes.size() != ECDSA_PAYLOAD_SIZE ||
                    !utils::IsValidSecp256k1Scalar(payload.bytes.data())) {
                    return Reject(SignError::INVALID_PAYLOAD, "Ecdsa payload cannot be converted to Scalar");
                }
                break;

            case CurveType::ED25519:
                if (!payload.IsEddsa()) {
                    return Reject(SignError::PAYLOAD_CURVE_MISMATCH,
                        std::string("Payload is not EdDSA, found: ") + PayloadTypeToString(payload.type));
                }
                if (payload.bytes.size() < EDDSA_MIN_PAYLOAD_SIZE || payload.bytes.size() > EDDSA_MAX_PAYLOAD_SIZE) {
                    return Reject(SignError::INVALID_PAYLOAD,
                        "Eddsa payload length out of range: " + std::to_string(payload.bytes.size()));
                }
                break;

            default:
                return Reject(SignError::PAYLOAD_CURVE_MISMATCH,
                    "Domain " + std::to_string(domain_id) + " has unsupported curve type");
        }

        // resume callback 비용까지 덮을 수 있어야 함
        if (reserved_gas < required_gas) {
            return Reject(SignError::INSUFFICIENT_GAS,
                "Provided: " + std::to_string(reserved_gas) + ", required: " + std::to_string(required_gas));
        }

        return result;
    }
}
