// src/common/env/EnvConfig.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace chainsig::env
{
    // 설정 누락 예외
    class ConfigMissingException : public std::runtime_error {
    public:
        explicit ConfigMissingException(const std::string& key)
            : std::runtime_error("Required config missing: " + key) {}
    };

    class EnvConfig
    {
    private:
        std::unordered_map<std::string, std::string> config_map;
        std::string env_type;
        bool is_loaded = false;

    public:
        EnvConfig() = default;
        ~EnvConfig() = default;

        // 환경 설정 파일 로드 (KEY=VALUE, '#' 주석)
        bool LoadFromFile(const std::string& file_path);
        bool LoadFromEnv(const std::string& env_name, const std::string& env_dir = "env");

        // 선택 값 (없으면 기본값, 형식 오류는 std::runtime_error)
        std::string GetStringOr(const std::string& key, const std::string& default_value) const;
        uint64_t GetUInt64Or(const std::string& key, uint64_t default_value) const;

        bool HasKey(const std::string& key) const;

        std::string GetEnvType() const { return env_type; }
        bool IsLoaded() const { return is_loaded; }

        // 여러 필수 키 한번에 검증 (누락 시 ConfigMissingException)
        void ValidateRequired(const std::vector<std::string>& required_keys) const;

        // 테스트 및 런타임 override 용
        void Set(const std::string& key, const std::string& value) { config_map[key] = value; }

    private:
        bool ParseLine(const std::string& line);
    };
} // namespace chainsig::env
