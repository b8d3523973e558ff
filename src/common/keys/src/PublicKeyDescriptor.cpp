// src/common/keys/src/PublicKeyDescriptor.cpp
#include "common/keys/include/PublicKeyDescriptor.hpp"
#include "common/keys/include/KeyServiceException.hpp"
#include "common/utils/hex/HexUtils.hpp"

namespace chainsig::keys
{
    std::string PublicKeyDescriptor::ToString() const
    {
        return std::string(CurveTypeToString(curve)) + ":" + utils::BytesToHex(key_bytes);
    }

    PublicKeyDescriptor PublicKeyDescriptor::FromString(const std::string& text)
    {
        size_t colon = text.find(':');
        if (colon == std::string::npos) {
            throw InvalidPublicKeyException("missing curve prefix in '" + text + "'");
        }

        PublicKeyDescriptor descriptor;
        descriptor.curve = CurveTypeFromString(text.substr(0, colon));
        if (descriptor.curve == CurveType::UNKNOWN) {
            throw InvalidPublicKeyException("unsupported curve '" + text.substr(0, colon) + "'");
        }

        auto bytes = utils::HexToBytes(text.substr(colon + 1));
        if (!bytes) {
            throw InvalidPublicKeyException("key material is not valid hex");
        }

        size_t expected = descriptor.curve == CurveType::SECP256K1
            ? SECP256K1_PUBLIC_KEY_SIZE
            : ED25519_PUBLIC_KEY_SIZE;

        if (bytes->size() != expected) {
            throw InvalidPublicKeyException(
                std::string(CurveTypeToString(descriptor.curve)) + " key must be " +
                std::to_string(expected) + " bytes, got " + std::to_string(bytes->size()));
        }

        descriptor.key_bytes = std::move(*bytes);
        return descriptor;
    }
}
