// src/common/env/EnvManager.hpp
#pragma once
#include "EnvConfig.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace chainsig::env
{
    /**
     * @brief 글로벌 설정 관리자 (싱글톤)
     *
     * 실행 파일(main)에서 한 번 초기화하고,
     * 서비스 구성 요소는 IntakeSettings 로 변환된 값만 전달받습니다.
     */
    class EnvManager
    {
    private:
        static std::unique_ptr<EnvManager> instance;
        static std::mutex instance_mutex;

        std::unique_ptr<EnvConfig> env_config;
        mutable std::mutex config_mutex;

        bool is_initialized = false;

        EnvManager() = default;

    public:
        ~EnvManager() = default;

        EnvManager(const EnvManager&) = delete;
        EnvManager& operator=(const EnvManager&) = delete;
        EnvManager(EnvManager&&) = delete;
        EnvManager& operator=(EnvManager&&) = delete;

        static EnvManager& Instance();

        /**
         * @brief 환경 설정 초기화
         * @param env_type 환경 타입 (local, dev, production)
         * @param dir .env.{env_type} 파일이 있는 디렉터리
         * @return 초기화 성공 여부
         */
        bool Initialize(const std::string& env_type, const std::string& dir = "env");

        bool IsInitialized() const;

        /**
         * @brief 환경 설정 객체 접근
         * @throws std::runtime_error 초기화되지 않은 경우
         */
        const EnvConfig& GetConfig() const;

        std::string GetEnvType() const;

        void ValidateRequired(const std::vector<std::string>& required_keys) const;

        /**
         * @brief 현재 로드된 설정 정보 출력 (디버깅용)
         */
        void PrintLoadedConfig() const;

    private:
        void EnsureInitialized() const;
    };

    namespace Config
    {
        inline const EnvConfig& Get() {
            return EnvManager::Instance().GetConfig();
        }

        inline void ValidateRequired(const std::vector<std::string>& required_keys) {
            EnvManager::Instance().ValidateRequired(required_keys);
        }
    }

} // namespace chainsig::env
