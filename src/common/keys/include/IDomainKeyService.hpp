// src/common/keys/include/IDomainKeyService.hpp
#pragma once
#include "common/keys/include/PublicKeyDescriptor.hpp"
#include <optional>

namespace chainsig::keys
{
    /**
     * @brief 도메인 키 관리 서비스 공통 인터페이스
     *
     * 서명 도메인(domain_id)별 활성 공개키와 곡선 타입을 조회합니다.
     * 키 생성/교체는 외부 협력자의 책임이며 여기서는 조회만 다룹니다.
     */
    class IDomainKeyService
    {
    public:
        virtual ~IDomainKeyService() = default;

        virtual bool Initialize() = 0;
        virtual bool IsInitialized() const = 0;

        /**
         * @brief 도메인 공개키 조회
         * @throws DomainNotFoundException 도메인에 활성 키가 없을 때
         * @throws KeyServiceException 기타 저장소 에러
         */
        virtual PublicKeyDescriptor GetPublicKey(DomainId domain_id) const = 0;

        virtual bool HasDomain(DomainId domain_id) const = 0;

        /**
         * @brief 도메인 키 등록 (프로비저닝 용)
         */
        virtual bool PutPublicKey(DomainId domain_id, const PublicKeyDescriptor& key) = 0;

        /**
         * @brief 가장 최근 도메인 ID (등록된 도메인이 없으면 nullopt)
         */
        virtual std::optional<DomainId> LatestDomainId() const = 0;
    };
}
