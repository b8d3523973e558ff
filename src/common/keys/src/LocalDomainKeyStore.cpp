// src/common/keys/src/LocalDomainKeyStore.cpp
#include "common/keys/include/LocalDomainKeyStore.hpp"
#include "common/keys/include/KeyServiceException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>

namespace chainsig::keys
{
    LocalDomainKeyStore::LocalDomainKeyStore(const std::string& path)
        : storage_path(path), is_initialized(false)
    {
        LOG_DEBUGF("LocalDomainKeyStore", "Created with storage path: %s", storage_path.string().c_str());
    }

    fs::path LocalDomainKeyStore::KeyFile(DomainId domain_id) const
    {
        return storage_path / (std::to_string(domain_id) + ".pub");
    }

    void LocalDomainKeyStore::EnsureInitialized() const
    {
        if (!is_initialized) {
            throw KeyServiceException("LocalDomainKeyStore is not initialized");
        }
    }

    bool LocalDomainKeyStore::Initialize()
    {
        std::lock_guard<std::mutex> lock(storage_mutex);

        if (is_initialized) {
            return true;
        }

        try {
            if (!fs::exists(storage_path)) {
                if (!fs::create_directories(storage_path)) {
                    LOG_ERRORF("LocalDomainKeyStore", "Failed to create storage directory: %s", storage_path.string().c_str());
                    return false;
                }
                LOG_INFOF("LocalDomainKeyStore", "Created storage directory: %s", fs::absolute(storage_path).string().c_str());
            }

            is_initialized = true;
            LOG_INFOF("LocalDomainKeyStore", "Initialized at %s", fs::absolute(storage_path).string().c_str());
            return true;

        } catch (const fs::filesystem_error& e) {
            LOG_ERRORF("LocalDomainKeyStore", "Filesystem error during initialization: %s", e.what());
            return false;
        }
    }

    bool LocalDomainKeyStore::IsInitialized() const
    {
        return is_initialized;
    }

    PublicKeyDescriptor LocalDomainKeyStore::GetPublicKey(DomainId domain_id) const
    {
        std::lock_guard<std::mutex> lock(storage_mutex);
        EnsureInitialized();

        fs::path key_file = KeyFile(domain_id);
        if (!fs::exists(key_file)) {
            throw DomainNotFoundException(domain_id);
        }

        std::ifstream file(key_file);
        if (!file.is_open()) {
            throw KeyServiceException("Failed to open key file for domain " + std::to_string(domain_id));
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        content.erase(std::remove_if(content.begin(), content.end(),
            [](unsigned char c) { return std::isspace(c) != 0; }), content.end());

        return PublicKeyDescriptor::FromString(content);
    }

    bool LocalDomainKeyStore::HasDomain(DomainId domain_id) const
    {
        std::lock_guard<std::mutex> lock(storage_mutex);
        EnsureInitialized();
        return fs::exists(KeyFile(domain_id));
    }

    bool LocalDomainKeyStore::PutPublicKey(DomainId domain_id, const PublicKeyDescriptor& key)
    {
        std::lock_guard<std::mutex> lock(storage_mutex);
        EnsureInitialized();

        fs::path key_file = KeyFile(domain_id);

        try {
            // 기존 파일이 있으면 쓰기 권한 복구
            if (fs::exists(key_file)) {
                fs::permissions(key_file,
                    fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace);
            }

            std::ofstream file(key_file, std::ios::trunc);
            if (!file.is_open()) {
                LOG_ERRORF("LocalDomainKeyStore", "Failed to write key for domain %llu",
                    static_cast<unsigned long long>(domain_id));
                return false;
            }

            file << key.ToString() << "\n";
            file.close();

            fs::permissions(key_file, fs::perms::owner_read, fs::perm_options::replace);

            LOG_INFOF("LocalDomainKeyStore", "Stored %s key for domain %llu",
                CurveTypeToString(key.curve), static_cast<unsigned long long>(domain_id));
            return true;

        } catch (const fs::filesystem_error& e) {
            LOG_ERRORF("LocalDomainKeyStore", "Exception storing key for domain %llu: %s",
                static_cast<unsigned long long>(domain_id), e.what());
            return false;
        }
    }

    std::optional<DomainId> LocalDomainKeyStore::LatestDomainId() const
    {
        std::lock_guard<std::mutex> lock(storage_mutex);
        EnsureInitialized();

        std::optional<DomainId> latest;

        for (const auto& entry : fs::directory_iterator(storage_path)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".pub") {
                continue;
            }

            std::string stem = entry.path().stem().string();
            if (stem.empty() || !std::all_of(stem.begin(), stem.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
                continue;
            }

            // 64비트를 넘는 이름은 도메인 파일이 아님
            DomainId id = 0;
            auto [parsed_end, ec] = std::from_chars(stem.data(), stem.data() + stem.size(), id);
            if (ec != std::errc() || parsed_end != stem.data() + stem.size()) {
                LOG_WARNF("LocalDomainKeyStore", "Ignoring key file with out-of-range domain: %s",
                    entry.path().filename().string().c_str());
                continue;
            }

            if (!latest || id > *latest) {
                latest = id;
            }
        }

        return latest;
    }

} // namespace chainsig::keys
