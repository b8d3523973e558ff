// src/service/main.cpp
#include "service/IntakeCommandHandler.hpp"
#include "common/env/EnvManager.hpp"
#include "common/keys/include/LocalDomainKeyStore.hpp"
#include "common/utils/logger/Logger.hpp"
#include "host/include/LocalHost.hpp"
#include "intake/include/IntakeSettings.hpp"
#include "intake/include/SignService.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace chainsig;
using namespace chainsig::env;

void PrintUsage(const char* program_name)
{
    LOG_INFOF("ChainsigIntake", "Usage: %s [ENVIRONMENT]", program_name);
    LOG_INFOF("ChainsigIntake", "       %s --env [ENVIRONMENT] [--env-dir DIR]", program_name);
    LOG_INFO("ChainsigIntake", "");
    LOG_INFO("ChainsigIntake", "Reads one JSON command per line from stdin and writes one JSON reply per line.");
    LOG_INFO("ChainsigIntake", "Environment:");
    LOG_INFO("ChainsigIntake", "  local       Local development environment (default)");
}

int main(int argc, char* argv[])
{
    // stdout 은 응답 전용
    utils::Logger::Instance().SetConsoleToStderr(true);
    utils::Logger::Instance().Initialize();

    LOG_INFO("ChainsigIntake", "=== Chain Signature Request Intake ===");
    LOG_INFOF("ChainsigIntake", "Build: %s %s", __DATE__, __TIME__);

    std::string env_type = "local";
    std::string env_dir = "env";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--env" && i + 1 < argc) {
            env_type = argv[++i];
        } else if (arg == "--env-dir" && i + 1 < argc) {
            env_dir = argv[++i];
        } else {
            env_type = arg;
        }
    }

    LOG_INFOF("ChainsigIntake", "Loading environment: %s", env_type.c_str());

    if (!EnvManager::Instance().Initialize(env_type, env_dir)) {
        LOG_ERRORF("ChainsigIntake", "Failed to load environment: %s", env_type.c_str());
        return 1;
    }

    intake::IntakeSettings settings;

    try {
        std::vector<std::string> required_keys = {
            "SERVICE_ACCOUNT_ID",
            "DOMAIN_KEY_PATH"
        };

        LOG_INFO("ChainsigIntake", "Validating required configuration...");
        Config::ValidateRequired(required_keys);
        settings = intake::IntakeSettings::FromConfig(Config::Get());
        EnvManager::Instance().PrintLoadedConfig();
        LOG_INFO("ChainsigIntake", "✓ Configuration loaded");

    } catch (const std::exception& e) {
        LOG_ERRORF("ChainsigIntake", "✗ Configuration error: %s", e.what());
        LOG_ERRORF("ChainsigIntake", "Please check your %s/.env.%s file.", env_dir.c_str(), env_type.c_str());
        return 1;
    }

    try {
        // ========================================
        // 1. 도메인 키 저장소
        // ========================================
        LOG_INFO("ChainsigIntake", "=== Domain Key Store Initialization ===");
        keys::LocalDomainKeyStore key_store(settings.domain_key_path);
        if (!key_store.Initialize()) {
            LOG_ERROR("ChainsigIntake", "✗ Failed to initialize domain key store");
            return 1;
        }

        auto latest = key_store.LatestDomainId();
        if (latest) {
            LOG_INFOF("ChainsigIntake", "✓ Domain key store ready (latest domain: %llu)",
                static_cast<unsigned long long>(*latest));
        } else {
            LOG_WARN("ChainsigIntake", "Domain key store is empty, every sign request will fail with DomainNotFound");
        }

        // ========================================
        // 2. 호스트 + 서비스
        // ========================================
        LOG_INFO("ChainsigIntake", "=== Intake Service Initialization ===");
        host::LocalHostOptions host_options;
        host_options.account_id = settings.service_account_id;
        host_options.yield_timeout_blocks = settings.yield_timeout_blocks;

        host::LocalHost local_host(host_options);
        intake::SignService sign_service(local_host, key_store, settings);
        service::IntakeCommandHandler handler(local_host, sign_service);
        LOG_INFO("ChainsigIntake", "✓ Intake service ready, reading commands from stdin");

        // ========================================
        // 3. 명령 루프
        // ========================================
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }
            std::cout << handler.HandleLine(line) << std::endl;
        }

        LOG_INFOF("ChainsigIntake", "Input closed, %zu request(s) still pending", sign_service.Registry().Size());

    } catch (const std::exception& e) {
        LOG_FATALF("ChainsigIntake", "Fatal error: %s", e.what());
        return 1;
    }

    LOG_INFO("ChainsigIntake", "=== Intake Service Terminated ===");
    return 0;
}
