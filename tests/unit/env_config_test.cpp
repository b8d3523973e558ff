// tests/unit/env_config_test.cpp
#include <gtest/gtest.h>
#include "IntakeTestSupport.hpp"
#include "common/env/EnvConfig.hpp"
#include "common/env/EnvManager.hpp"
#include "intake/include/IntakeSettings.hpp"
#include <filesystem>
#include <fstream>

using namespace chainsig;
using namespace chainsig::env;
using namespace chainsig::intake;
namespace fs = std::filesystem;

// ========== 테스트 Fixture ==========

class EnvConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        env_dir = test::UniqueTempDir("chainsig_env");
        fs::create_directories(env_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(env_dir, ec);
    }

    void WriteEnv(const std::string& name, const std::string& content) {
        std::ofstream file(env_dir / (".env." + name));
        file << content;
    }

    fs::path env_dir;
};

// ========== EnvConfig ==========

TEST_F(EnvConfigTest, LoadsKeyValueFile) {
    WriteEnv("test",
        "# comment\n"
        "\n"
        "SERVICE_ACCOUNT_ID = signer.test\n"
        "SIGN_MIN_DEPOSIT=5\n"
        "EMPTY_VALUE=\n"
        "this line is ignored\n");

    EnvConfig config;
    ASSERT_TRUE(config.LoadFromEnv("test", env_dir.string()));

    EXPECT_TRUE(config.IsLoaded());
    EXPECT_EQ(config.GetEnvType(), "test");
    EXPECT_EQ(config.GetStringOr("SERVICE_ACCOUNT_ID", ""), "signer.test");
    EXPECT_EQ(config.GetUInt64Or("SIGN_MIN_DEPOSIT", 1), 5u);
    EXPECT_TRUE(config.HasKey("EMPTY_VALUE"));
    EXPECT_EQ(config.GetStringOr("EMPTY_VALUE", "fallback"), "fallback");
    EXPECT_FALSE(config.HasKey("this line is ignored"));
}

TEST_F(EnvConfigTest, MissingFileFails) {
    EnvConfig config;
    EXPECT_FALSE(config.LoadFromEnv("absent", env_dir.string()));
    EXPECT_FALSE(config.IsLoaded());
}

TEST_F(EnvConfigTest, TypedGettersRejectBadValues) {
    EnvConfig config;
    config.Set("NEGATIVE", "-5");
    config.Set("HUGE", "99999999999999999999999");
    config.Set("WORD", "maybe");

    EXPECT_EQ(config.GetUInt64Or("MISSING", 42), 42u);
    EXPECT_THROW(config.GetUInt64Or("NEGATIVE", 42), std::runtime_error);
    EXPECT_THROW(config.GetUInt64Or("HUGE", 42), std::runtime_error);
    EXPECT_THROW(config.GetUInt64Or("WORD", 42), std::runtime_error);
}

TEST_F(EnvConfigTest, ValidateRequiredListsMissingKeys) {
    EnvConfig config;
    config.Set("A", "1");
    config.Set("EMPTY", "");

    try {
        config.ValidateRequired({"A", "B", "EMPTY"});
        FAIL() << "ConfigMissingException expected";
    } catch (const ConfigMissingException& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("B"), std::string::npos);
        EXPECT_NE(msg.find("EMPTY"), std::string::npos);
        EXPECT_EQ(msg.find("A,"), std::string::npos);
    }
}

TEST_F(EnvConfigTest, EnvManagerInitializesOnce) {
    WriteEnv("manager", "SIGN_MIN_DEPOSIT=3\n");

    EnvManager& manager = EnvManager::Instance();
    ASSERT_TRUE(manager.Initialize("manager", env_dir.string()));
    EXPECT_TRUE(manager.IsInitialized());
    EXPECT_EQ(Config::Get().GetUInt64Or("SIGN_MIN_DEPOSIT", 1), 3u);
    EXPECT_NO_THROW(Config::ValidateRequired({"SIGN_MIN_DEPOSIT"}));
    EXPECT_THROW(Config::ValidateRequired({"SERVICE_ACCOUNT_ID"}), ConfigMissingException);

    // 다른 환경으로 재초기화 불가, 같은 환경은 성공
    EXPECT_FALSE(manager.Initialize("other", env_dir.string()));
    EXPECT_TRUE(manager.Initialize("manager", env_dir.string()));
    EXPECT_EQ(manager.GetEnvType(), "manager");
}

// ========== IntakeSettings ==========

TEST(IntakeSettingsTest, DefaultsMatchObservedConstants) {
    IntakeSettings settings = IntakeSettings::Defaults();

    EXPECT_EQ(settings.min_deposit, 1u);
    EXPECT_EQ(settings.gas_for_sign_call, 10 * TGAS);
    EXPECT_EQ(settings.resume_call_gas, 7 * TGAS);
    EXPECT_EQ(settings.yield_timeout_blocks, 200u);
    EXPECT_EQ(settings.fee_policy, FeePolicyKind::FIXED);
    EXPECT_NO_THROW(settings.Validate());
}

TEST(IntakeSettingsTest, FromConfigOverridesDefaults) {
    EnvConfig config;
    config.Set("SERVICE_ACCOUNT_ID", "v1.signer");
    config.Set("SIGN_MIN_DEPOSIT", "10");
    config.Set("SIGN_YIELD_TIMEOUT_BLOCKS", "50");
    config.Set("SIGN_FEE_POLICY", "load");
    config.Set("SIGN_FEE_LOAD_STEP", "4");

    IntakeSettings settings = IntakeSettings::FromConfig(config);

    EXPECT_EQ(settings.service_account_id, "v1.signer");
    EXPECT_EQ(settings.min_deposit, 10u);
    EXPECT_EQ(settings.yield_timeout_blocks, 50u);
    EXPECT_EQ(settings.fee_policy, FeePolicyKind::PENDING_LOAD);
    EXPECT_EQ(settings.fee_load_step, 4u);
    EXPECT_EQ(settings.gas_for_sign_call, 10 * TGAS);
}

TEST(IntakeSettingsTest, FromConfigRejectsInconsistentValues) {
    {
        EnvConfig config;
        config.Set("SIGN_FEE_POLICY", "auction");
        EXPECT_THROW(IntakeSettings::FromConfig(config), std::runtime_error);
    }
    {
        EnvConfig config;
        config.Set("SIGN_GAS_FOR_SIGN_CALL", "5000000000000");
        EXPECT_THROW(IntakeSettings::FromConfig(config), std::runtime_error);
    }
    {
        EnvConfig config;
        config.Set("SIGN_MIN_DEPOSIT", "0");
        EXPECT_THROW(IntakeSettings::FromConfig(config), std::runtime_error);
    }
}
