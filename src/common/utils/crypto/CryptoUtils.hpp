// src/common/utils/crypto/CryptoUtils.hpp
#pragma once
#include "common/types/BasicTypes.hpp"
#include <string>
#include <vector>

namespace chainsig::utils
{
    /**
     * @brief OpenSSL EVP 기반 해시 함수
     * @throws std::runtime_error OpenSSL digest 실패 시
     */
    CryptoHash Sha256(const uint8_t* data, size_t length);
    CryptoHash Sha3_256(const uint8_t* data, size_t length);

    inline CryptoHash Sha256(const std::vector<uint8_t>& data)
    {
        return Sha256(data.data(), data.size());
    }

    inline CryptoHash Sha3_256(const std::string& data)
    {
        return Sha3_256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }

    /**
     * @brief 32바이트 big-endian 값이 secp256k1 스칼라 필드(0 <= x < n)에 속하는지 확인
     */
    bool IsValidSecp256k1Scalar(const uint8_t* bytes32);
}
