// src/common/keys/include/LocalDomainKeyStore.hpp
#pragma once

#include "IDomainKeyService.hpp"
#include <filesystem>
#include <mutex>

namespace chainsig::keys
{
    namespace fs = std::filesystem;

    /**
     * @brief 파일 기반 도메인 키 저장소
     *
     * {storage_path}/{domain_id}.pub 파일 하나에 "curve:hex" 한 줄
     */
    class LocalDomainKeyStore : public IDomainKeyService
    {
    private:
        fs::path storage_path;
        mutable std::mutex storage_mutex;
        bool is_initialized;

        fs::path KeyFile(DomainId domain_id) const;
        void EnsureInitialized() const;

    public:
        explicit LocalDomainKeyStore(const std::string& path);
        ~LocalDomainKeyStore() override = default;

        bool Initialize() override;
        bool IsInitialized() const override;

        PublicKeyDescriptor GetPublicKey(DomainId domain_id) const override;
        bool HasDomain(DomainId domain_id) const override;
        bool PutPublicKey(DomainId domain_id, const PublicKeyDescriptor& key) override;
        std::optional<DomainId> LatestDomainId() const override;
    };

} // namespace chainsig::keys
