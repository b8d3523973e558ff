// src/common/env/EnvManager.cpp
#include "common/env/EnvManager.hpp"
#include "common/utils/logger/Logger.hpp"
#include <stdexcept>

namespace chainsig::env
{
    std::unique_ptr<EnvManager> EnvManager::instance = nullptr;
    std::mutex EnvManager::instance_mutex;

    EnvManager& EnvManager::Instance()
    {
        std::lock_guard<std::mutex> lock(instance_mutex);

        if (!instance) {
            // private 생성자이므로 make_unique 사용 불가
            instance = std::unique_ptr<EnvManager>(new EnvManager());
        }

        return *instance;
    }

    bool EnvManager::Initialize(const std::string& env_type, const std::string& dir)
    {
        std::lock_guard<std::mutex> lock(config_mutex);

        if (is_initialized) {
            LOG_WARNF("EnvManager", "Already initialized. Current env: %s, requested: %s",
                env_config->GetEnvType().c_str(), env_type.c_str());
            return env_config->GetEnvType() == env_type;
        }

        env_config = std::make_unique<EnvConfig>();

        if (!env_config->LoadFromEnv(env_type, dir)) {
            LOG_ERRORF("EnvManager", "Failed to load environment configuration: %s", env_type.c_str());
            env_config.reset();
            return false;
        }

        is_initialized = true;
        LOG_INFOF("EnvManager", "Initialized with environment: %s", env_type.c_str());
        return true;
    }

    bool EnvManager::IsInitialized() const
    {
        std::lock_guard<std::mutex> lock(config_mutex);
        return is_initialized;
    }

    const EnvConfig& EnvManager::GetConfig() const
    {
        EnsureInitialized();
        return *env_config;
    }

    void EnvManager::EnsureInitialized() const
    {
        std::lock_guard<std::mutex> lock(config_mutex);
        if (!is_initialized || !env_config) {
            throw std::runtime_error(
                "EnvManager not initialized. Call EnvManager::Instance().Initialize(env_type) first."
            );
        }
    }

    std::string EnvManager::GetEnvType() const
    {
        return GetConfig().GetEnvType();
    }

    void EnvManager::ValidateRequired(const std::vector<std::string>& required_keys) const
    {
        GetConfig().ValidateRequired(required_keys);
    }

    void EnvManager::PrintLoadedConfig() const
    {
        if (!IsInitialized()) {
            LOG_INFO("EnvManager", "Not initialized");
            return;
        }

        const EnvConfig& config = GetConfig();

        LOG_INFO("EnvManager", "=== Current Configuration ===");
        LOG_INFOF("EnvManager", "Environment: %s", config.GetEnvType().c_str());

        const std::vector<std::string> safe_keys = {
            "SERVICE_ACCOUNT_ID", "DOMAIN_KEY_PATH",
            "SIGN_MIN_DEPOSIT", "SIGN_GAS_FOR_SIGN_CALL", "SIGN_RESUME_CALL_GAS",
            "SIGN_YIELD_TIMEOUT_BLOCKS", "SIGN_FEE_POLICY", "SIGN_FEE_LOAD_STEP",
            "LOG_LEVEL"
        };

        for (const auto& key : safe_keys) {
            if (config.HasKey(key)) {
                LOG_INFOF("EnvManager", "  %s: %s", key.c_str(), config.GetStringOr(key, "").c_str());
            }
        }
    }

} // namespace chainsig::env
