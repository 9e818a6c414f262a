// tests/test_env.cpp
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

using airgap::Config;
using airgap::Error;

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

static const std::string INSTANCE_HEX =
    "02000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";

TEST(Env_Config, DefaultsWhenUnset)
{
    EnvGuard g_v(constants::ENV_VERSION), g_i(constants::ENV_INSTANCE_ID),
        g_c(constants::ENV_CHUNK_SIZE), g_p(constants::ENV_PSK);
    g_v.unset();
    g_i.unset();
    g_c.unset();
    g_p.unset();

    Config cfg;
    ASSERT_EQ(airgap::load_config_from_env(cfg), Error::Ok);
    EXPECT_EQ(cfg.version, airgap::VERSION_DEFAULT);
    EXPECT_TRUE(cfg.instance_id.empty());
    EXPECT_EQ(cfg.chunk_size, 192u);
    EXPECT_TRUE(cfg.psk_hex.empty());
}

TEST(Env_Config, FromEnv)
{
    EnvGuard g_v(constants::ENV_VERSION), g_i(constants::ENV_INSTANCE_ID),
        g_c(constants::ENV_CHUNK_SIZE), g_p(constants::ENV_PSK);
    g_v.set("7");
    g_i.set(INSTANCE_HEX);
    g_c.set("300");
    g_p.set("1111111111111111111111111111111111111111111111111111111111111111");

    Config cfg;
    ASSERT_EQ(airgap::load_config_from_env(cfg), Error::Ok);
    EXPECT_EQ(cfg.version, 7u);
    ASSERT_EQ(cfg.instance_id.size(), airgap::INSTANCE_ID_SIZE);
    EXPECT_EQ(cfg.instance_id[0], 0x02);
    EXPECT_EQ(cfg.instance_id[32], 0x1f);
    EXPECT_EQ(cfg.chunk_size, 300u);
    EXPECT_FALSE(cfg.psk_hex.empty());
}

TEST(Env_Config, InvalidValuesLeaveConfigUntouched)
{
    EnvGuard g_v(constants::ENV_VERSION), g_i(constants::ENV_INSTANCE_ID),
        g_c(constants::ENV_CHUNK_SIZE), g_p(constants::ENV_PSK);
    g_v.unset();
    g_p.unset();
    g_i.set(INSTANCE_HEX);

    Config cfg;
    g_c.set("5");
    EXPECT_EQ(airgap::load_config_from_env(cfg), Error::ChunkSizeTooSmall);
    g_c.set("65536");
    EXPECT_EQ(airgap::load_config_from_env(cfg), Error::ChunkSizeTooLarge);
    g_c.set("12abc");
    EXPECT_EQ(airgap::load_config_from_env(cfg), Error::InvalidNumber);
    // instance id was valid but nothing is applied on failure
    EXPECT_TRUE(cfg.instance_id.empty());
    EXPECT_EQ(cfg.chunk_size, 192u);

    g_c.unset();
    g_i.set("0203");
    EXPECT_EQ(airgap::load_config_from_env(cfg), Error::InvalidInstanceId);

    g_i.unset();
    g_v.set("256");
    EXPECT_EQ(airgap::load_config_from_env(cfg), Error::InvalidNumber);

    g_v.unset();
    g_p.set("abcd");
    EXPECT_EQ(airgap::load_config_from_env(cfg), Error::InvalidKey);
}

TEST(Config, ParseBoundaries)
{
    Config cfg;
    EXPECT_EQ(airgap::parse_chunk_size("6", cfg), Error::Ok);
    EXPECT_EQ(cfg.chunk_size, 6u);
    EXPECT_EQ(airgap::parse_chunk_size("65535", cfg), Error::Ok);
    EXPECT_EQ(cfg.chunk_size, 65535u);
    EXPECT_EQ(airgap::parse_chunk_size("-1", cfg), Error::InvalidNumber);
    EXPECT_EQ(airgap::parse_chunk_size("", cfg), Error::InvalidNumber);
    EXPECT_EQ(airgap::parse_version("0", cfg), Error::Ok);
    EXPECT_EQ(airgap::parse_version("255", cfg), Error::Ok);
    EXPECT_EQ(cfg.version, 255u);
    EXPECT_EQ(airgap::parse_instance_id(INSTANCE_HEX + "zz", cfg), Error::InvalidInstanceId);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace airgap;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);
    EXPECT_NE(out2.find("[ERROR]"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);

    // quiet: only SYSTEM
    set_log_level_by_name("quiet");
    testing::internal::CaptureStderr();
    LOG_ERROR("error_hidden");
    LOG_SYSTEM("system_shown");
    std::string out4 = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out4.find("error_hidden"), std::string::npos);
    EXPECT_NE(out4.find("system_shown"), std::string::npos);

    set_log_level(Level::Info);
}
