// src/common/keys/include/KeyServiceException.hpp
#pragma once
#include "common/types/BasicTypes.hpp"
#include <stdexcept>
#include <string>

namespace chainsig::keys
{
    /**
     * @brief 도메인 키 서비스 기본 예외 클래스
     */
    class KeyServiceException : public std::runtime_error
    {
    public:
        explicit KeyServiceException(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @brief 도메인에 활성 키가 없을 때 발생
     */
    class DomainNotFoundException : public KeyServiceException
    {
    public:
        explicit DomainNotFoundException(DomainId domain_id)
            : KeyServiceException("No key was found for the provided domain_id " + std::to_string(domain_id))
            , domain_id(domain_id) {}

        DomainId domain_id;
    };

    /**
     * @brief 공개키 표현이 곡선 형식과 맞지 않을 때 발생
     */
    class InvalidPublicKeyException : public KeyServiceException
    {
    public:
        explicit InvalidPublicKeyException(const std::string& msg)
            : KeyServiceException("Invalid public key: " + msg) {}
    };
}
