#include <gtest/gtest.h>

#include <QByteArray>
#include <QtGlobal>
#include <chrono>

#include "cppquery/backend/backend_config.h"

using namespace cppquery;

namespace {

    std::optional<std::string> pragmaValue(const BackendConfig& config, const std::string& name) {
        for (const auto& [key, value] : config.pragmas) {
            if (key == name) return value;
        }
        return std::nullopt;
    }

    std::optional<std::string> sessionSetting(const cppquery_sqldriver::ConnectionParameters& params, const std::string& name) {
        for (const auto& [key, value] : params.session_settings) {
            if (key == name) return value;
        }
        return std::nullopt;
    }

}  // namespace

TEST(BackendConfigTest, Defaults) {
    BackendConfig config;
    EXPECT_EQ(config.driver_type, "SQLITE");
    EXPECT_TRUE(config.isMemoryDatabase());
    EXPECT_DOUBLE_EQ(config.lock_wait_timeout_s, 5.0);
    EXPECT_FALSE(config.statement_timeout.has_value());
    EXPECT_EQ(pragmaValue(config, "foreign_keys"), std::optional<std::string>("ON"));
    EXPECT_EQ(pragmaValue(config, "journal_mode"), std::optional<std::string>("WAL"));
    EXPECT_EQ(pragmaValue(config, "synchronous"), std::optional<std::string>("FULL"));
    EXPECT_TRUE(config.validate().has_value());
}

TEST(BackendConfigTest, FromUriMemory) {
    auto config = BackendConfig::fromUri("sqlite://:memory:");
    ASSERT_TRUE(config.has_value()) << config.error().toString();
    EXPECT_TRUE(config->isMemoryDatabase());

    auto bare = BackendConfig::fromUri("sqlite://");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->database, ":memory:");
}

TEST(BackendConfigTest, FromUriRelativePathWithOptions) {
    auto config = BackendConfig::fromUri("sqlite:///data/app.db?timeout=2.5&statement_timeout_ms=100&foreign_keys=OFF&cache_size=-2000");
    ASSERT_TRUE(config.has_value()) << config.error().toString();
    EXPECT_EQ(config->database, "data/app.db");
    EXPECT_DOUBLE_EQ(config->lock_wait_timeout_s, 2.5);
    EXPECT_EQ(config->statement_timeout, std::optional<std::chrono::milliseconds>(std::chrono::milliseconds(100)));
    EXPECT_EQ(pragmaValue(*config, "foreign_keys"), std::optional<std::string>("OFF"));
    EXPECT_EQ(pragmaValue(*config, "cache_size"), std::optional<std::string>("-2000"));
    // 覆盖同名 PRAGMA 时保持原有位置
    EXPECT_EQ(config->pragmas.front().first, "foreign_keys");
}

TEST(BackendConfigTest, FromUriAbsolutePathReadOnly) {
    auto config = BackendConfig::fromUri("sqlite:////var/lib/app%20data.db?mode=ro");
    ASSERT_TRUE(config.has_value()) << config.error().toString();
    EXPECT_EQ(config->database, "/var/lib/app data.db");
    EXPECT_TRUE(config->read_only);
    EXPECT_FALSE(config->create_if_missing);
}

TEST(BackendConfigTest, FromUriRejectsBadInput) {
    for (const char* uri : {"postgres://localhost/db", "sqlite://host/app.db", "sqlite:///app.db?timeout=soon", "sqlite:///app.db?mode=append", "sqlite:///app.db?=1", "sqlite://:memory:?mode=ro"}) {
        auto config = BackendConfig::fromUri(uri);
        ASSERT_FALSE(config.has_value()) << uri;
        EXPECT_EQ(config.error().code, ErrorCode::InvalidConfiguration) << uri;
        EXPECT_EQ(config.error().kind(), ErrorKind::Construction) << uri;
    }
}

TEST(BackendConfigTest, NonPositiveStatementTimeoutInUriDisablesIt) {
    auto config = BackendConfig::fromUri("sqlite://:memory:?statement_timeout_ms=0");
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->statement_timeout.has_value());
}

TEST(BackendConfigTest, ValidateRejectsInconsistentSettings) {
    BackendConfig negative;
    negative.lock_wait_timeout_s = -1.0;
    EXPECT_FALSE(negative.validate().has_value());

    BackendConfig zero_timeout;
    zero_timeout.statement_timeout = std::chrono::milliseconds(0);
    EXPECT_FALSE(zero_timeout.validate().has_value());

    BackendConfig read_only_memory;
    read_only_memory.read_only = true;
    EXPECT_FALSE(read_only_memory.validate().has_value());

    BackendConfig empty_pragma;
    empty_pragma.setPragma("cache_size", "");
    auto result = empty_pragma.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfiguration);
}

TEST(BackendConfigTest, DriverParametersSkipWalForMemory) {
    BackendConfig config;
    config.lock_wait_timeout_s = 1.25;
    auto params = config.toDriverParameters();
    EXPECT_EQ(params.driverType(), std::optional<std::string>("SQLITE"));
    EXPECT_EQ(params.dbName(), std::optional<std::string>(":memory:"));
    EXPECT_EQ(params.busyTimeoutMs(), std::optional<long long>(1250));
    EXPECT_FALSE(sessionSetting(params, "journal_mode").has_value());
    EXPECT_EQ(sessionSetting(params, "foreign_keys"), std::optional<std::string>("ON"));
    ASSERT_EQ(params.session_settings.size(), 2u);
    EXPECT_EQ(params.session_settings[1].first, "synchronous");

    BackendConfig file;
    file.database = "app.db";
    EXPECT_EQ(sessionSetting(file.toDriverParameters(), "journal_mode"), std::optional<std::string>("WAL"));

    file.read_only = true;
    auto read_only = file.toDriverParameters();
    EXPECT_EQ(read_only.readOnly(), std::optional<bool>(true));
    EXPECT_FALSE(sessionSetting(read_only, "journal_mode").has_value());
}

class BackendConfigEnvironmentTest : public ::testing::Test {
  protected:
    void TearDown() override {
        for (const char* name : {"CPPQUERY_TEST_DATABASE", "CPPQUERY_TEST_TIMEOUT", "CPPQUERY_TEST_STATEMENT_TIMEOUT_MS", "CPPQUERY_TEST_READ_ONLY", "CPPQUERY_TEST_PRAGMA_CACHE_SIZE"}) {
            qunsetenv(name);
        }
    }
};

TEST_F(BackendConfigEnvironmentTest, ReadsPrefixedVariables) {
    qputenv("CPPQUERY_TEST_DATABASE", QByteArray("env.db"));
    qputenv("CPPQUERY_TEST_TIMEOUT", QByteArray("0.5"));
    qputenv("CPPQUERY_TEST_STATEMENT_TIMEOUT_MS", QByteArray("250"));
    qputenv("CPPQUERY_TEST_PRAGMA_CACHE_SIZE", QByteArray("4000"));

    auto config = BackendConfig::fromEnvironment("CPPQUERY_TEST_");
    ASSERT_TRUE(config.has_value()) << config.error().toString();
    EXPECT_EQ(config->database, "env.db");
    EXPECT_DOUBLE_EQ(config->lock_wait_timeout_s, 0.5);
    EXPECT_EQ(config->statement_timeout, std::optional<std::chrono::milliseconds>(std::chrono::milliseconds(250)));
    EXPECT_EQ(pragmaValue(*config, "cache_size"), std::optional<std::string>("4000"));
}

TEST_F(BackendConfigEnvironmentTest, InvalidValueIsConfigurationError) {
    qputenv("CPPQUERY_TEST_READ_ONLY", QByteArray("sometimes"));
    auto config = BackendConfig::fromEnvironment("CPPQUERY_TEST_");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfiguration);
}

TEST_F(BackendConfigEnvironmentTest, NoVariablesGivesDefaults) {
    auto config = BackendConfig::fromEnvironment("CPPQUERY_TEST_");
    ASSERT_TRUE(config.has_value()) << config.error().toString();
    EXPECT_TRUE(config->isMemoryDatabase());
}
