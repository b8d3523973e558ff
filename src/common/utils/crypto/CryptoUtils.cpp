// src/common/utils/crypto/CryptoUtils.cpp
#include "common/utils/crypto/CryptoUtils.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <algorithm>
#include <stdexcept>

namespace chainsig::utils
{
    namespace
    {
        CryptoHash Digest(const EVP_MD* md, const uint8_t* data, size_t length, const char* name)
        {
            CryptoHash out{};
            unsigned int out_len = 0;

            if (EVP_Digest(data, length, out.data(), &out_len, md, nullptr) != 1 || out_len != out.size()) {
                throw std::runtime_error(std::string("OpenSSL digest failed: ") + name);
            }
            return out;
        }

        // secp256k1 group order n (big-endian), 최초 1회만 OpenSSL에서 읽어옴
        std::array<uint8_t, 32> LoadSecp256k1Order()
        {
            std::array<uint8_t, 32> order{};

            EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
            if (!group) {
                throw std::runtime_error("Failed to create secp256k1 group");
            }

            const BIGNUM* n = EC_GROUP_get0_order(group);
            if (!n || BN_bn2binpad(n, order.data(), static_cast<int>(order.size())) != static_cast<int>(order.size())) {
                EC_GROUP_free(group);
                throw std::runtime_error("Failed to read secp256k1 group order");
            }

            EC_GROUP_free(group);
            return order;
        }
    }

    CryptoHash Sha256(const uint8_t* data, size_t length)
    {
        return Digest(EVP_sha256(), data, length, "sha256");
    }

    CryptoHash Sha3_256(const uint8_t* data, size_t length)
    {
        return Digest(EVP_sha3_256(), data, length, "sha3-256");
    }

    bool IsValidSecp256k1Scalar(const uint8_t* bytes32)
    {
        static const std::array<uint8_t, 32> order = LoadSecp256k1Order();

        // 같은 길이의 big-endian 비교는 사전식 비교와 동일
        return std::lexicographical_compare(bytes32, bytes32 + 32, order.begin(), order.end());
    }
}
