// src/common/env/EnvConfig.cpp
#include "common/env/EnvConfig.hpp"
#include "common/utils/logger/Logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace chainsig::env
{
    namespace
    {
        void Trim(std::string& value, const char* whitespace = " \t\r\n")
        {
            value.erase(0, value.find_first_not_of(whitespace));
            size_t last = value.find_last_not_of(whitespace);
            if (last == std::string::npos) {
                value.clear();
            } else {
                value.erase(last + 1);
            }
        }
    }

    bool EnvConfig::LoadFromFile(const std::string& file_path)
    {
        std::ifstream file(file_path);
        if (!file.is_open())
        {
            LOG_ERRORF("EnvConfig", "Failed to open config file: %s", file_path.c_str());
            return false;
        }
        config_map.clear();

        std::string line;
        size_t line_no = 0;
        while (std::getline(file, line))
        {
            ++line_no;
            if (!ParseLine(line)) {
                LOG_WARNF("EnvConfig", "Ignoring malformed line %zu in %s", line_no, file_path.c_str());
            }
        }

        is_loaded = true;
        LOG_INFOF("EnvConfig", "Loaded %zu configuration entries from %s", config_map.size(), file_path.c_str());
        return true;
    }

    bool EnvConfig::LoadFromEnv(const std::string& env_name, const std::string& env_dir)
    {
        env_type = env_name;
        return LoadFromFile(env_dir + "/.env." + env_name);
    }

    std::string EnvConfig::GetStringOr(const std::string& key, const std::string& default_value) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end() || it->second.empty()) {
            return default_value;
        }
        return it->second;
    }

    uint64_t EnvConfig::GetUInt64Or(const std::string& key, uint64_t default_value) const
    {
        auto it = config_map.find(key);
        if (it == config_map.end() || it->second.empty()) {
            return default_value;
        }

        const std::string& value = it->second;

        // stoull은 음수 문자열도 받아들이므로 직접 확인
        if (!std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw std::runtime_error("Invalid unsigned value for key '" + key + "': " + value);
        }

        try {
            return static_cast<uint64_t>(std::stoull(value));
        } catch (const std::out_of_range&) {
            throw std::runtime_error("Invalid unsigned value for key '" + key + "': " + value);
        }
    }

    bool EnvConfig::HasKey(const std::string& key) const
    {
        return config_map.find(key) != config_map.end();
    }

    void EnvConfig::ValidateRequired(const std::vector<std::string>& required_keys) const
    {
        std::vector<std::string> missing_keys;

        for (const std::string& key : required_keys) {
            if (!HasKey(key) || config_map.at(key).empty()) {
                missing_keys.push_back(key);
            }
        }

        if (!missing_keys.empty()) {
            std::stringstream ss;
            for (size_t i = 0; i < missing_keys.size(); ++i) {
                ss << missing_keys[i];
                if (i < missing_keys.size() - 1) {
                    ss << ", ";
                }
            }
            throw ConfigMissingException(ss.str());
        }
    }

    bool EnvConfig::ParseLine(const std::string& line)
    {
        std::string trimmed = line;
        Trim(trimmed);

        // 빈 줄이나 주석은 무시
        if (trimmed.empty() || trimmed[0] == '#')
        {
            return true;
        }

        size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos)
        {
            return false;
        }

        std::string key = trimmed.substr(0, eq_pos);
        std::string value = trimmed.substr(eq_pos + 1);
        Trim(key, " \t");
        Trim(value, " \t");

        if (key.empty())
        {
            return false;
        }

        config_map[key] = value;
        return true;
    }
} // namespace chainsig::env
