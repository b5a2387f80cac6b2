#include <gtest/gtest.h>

#include <boost/json.hpp>

#include <cstdlib>
#include <fstream>

#include "conf/aigate_config.hpp"
#include "conf/config_sources.hpp"
#include "test_config_utils.hpp"

namespace {

namespace json = boost::json;

class ConfigSourcesTest : public ::testing::Test {
protected:
  void TearDown() override { ::unsetenv("AIGATE_API_KEY"); }

  testinfra::TempDir base_{"aigate-conf"};
};

TEST_F(ConfigSourcesTest, LaterSourcesOverrideEarlierOnes) {
  auto system_dir = base_.path / "system";
  auto user_dir = base_.path / "user";
  testinfra::write_json_file(system_dir / "application.json",
                             {{"api_key", "sk_system"},
                              {"bundle_id", "com.example.app"},
                              {"timeout_seconds", 30}});
  testinfra::write_json_file(system_dir / "application.dev.json",
                             {{"timeout_seconds", 10}});
  testinfra::write_json_file(user_dir / "application.json",
                             {{"api_key", "sk_user"}});
  testinfra::write_json_file(user_dir / "application.override.json",
                             {{"environment", "test"}});

  aigate::ConfigSources sources({system_dir, user_dir}, {"dev"},
                                {{"url_base", "https://cli.example.test"}});
  ASSERT_TRUE(sources.application_json.has_value());
  const auto &obj = sources.application_json->as_object();
  EXPECT_EQ(obj.at("api_key").as_string(), "sk_user");
  EXPECT_EQ(obj.at("bundle_id").as_string(), "com.example.app");
  EXPECT_EQ(obj.at("timeout_seconds").as_int64(), 10);
  EXPECT_EQ(obj.at("environment").as_string(), "test");
  EXPECT_EQ(obj.at("url_base").as_string(), "https://cli.example.test");
}

TEST_F(ConfigSourcesTest, MissingConfigIsNullopt) {
  aigate::ConfigSources sources({base_.path}, {});
  EXPECT_FALSE(sources.application_json.has_value());
  EXPECT_FALSE(sources.json_content("log_config").has_value());
  EXPECT_EQ(sources.logging_config().log_file, "aigate");
  EXPECT_THROW(aigate::AigateConfigProviderFile provider(sources),
               std::runtime_error);
}

TEST_F(ConfigSourcesTest, MalformedFileThrows) {
  std::ofstream(base_.path / "application.json") << "{ not json";
  EXPECT_THROW(aigate::ConfigSources sources({base_.path}, {}),
               std::runtime_error);
}

TEST_F(ConfigSourcesTest, LoggingConfigIsParsed) {
  testinfra::write_json_file(base_.path / "log_config.json",
                             {{"level", "debug"},
                              {"log_dir", "/var/log/aigate"},
                              {"rotation_size", 4096}});
  aigate::ConfigSources sources({base_.path}, {});
  auto lc = sources.logging_config();
  EXPECT_EQ(lc.level, "debug");
  EXPECT_EQ(lc.log_dir, "/var/log/aigate");
  EXPECT_EQ(lc.log_file, "aigate");
  EXPECT_EQ(lc.rotation_size, 4096u);
}

TEST_F(ConfigSourcesTest, ProviderReadsConfigAndEnvironmentKey) {
  testinfra::write_json_file(base_.path / "application.json",
                             {{"api_key", "sk_file"},
                              {"bundle_id", "com.example.app"},
                              {"team_id", "ABCDE12345"},
                              {"environment", "test"},
                              {"attestation_mode", "simulator"},
                              {"runtime_dir", base_.path.string()},
                              {"stream_buffer_chunks", 0}});
  aigate::ConfigSources sources({base_.path}, {});

  {
    aigate::AigateConfigProviderFile provider(sources);
    const auto &cfg = provider.get();
    EXPECT_EQ(cfg.api_key, "sk_file");
    EXPECT_EQ(cfg.environment, aigate::Environment::Test);
    EXPECT_EQ(cfg.attestation_mode, aigate::AttestationMode::Simulator);
    EXPECT_EQ(cfg.runtime_dir, base_.path);
    EXPECT_EQ(cfg.stream_buffer_chunks, 1u);
    EXPECT_EQ(cfg.timeout_seconds, 60);
    EXPECT_EQ(cfg.resolved_base_url(), aigate::kTestBaseUrl);
  }

  ::setenv("AIGATE_API_KEY", "sk_env", 1);
  aigate::AigateConfigProviderFile provider(sources);
  EXPECT_EQ(provider.get().api_key, "sk_env");
}

TEST(AigateConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(json::value_to<aigate::AigateConfig>(
                   json::value(json::object{{"environment", "staging"}})),
               std::runtime_error);
  EXPECT_THROW(json::value_to<aigate::AigateConfig>(
                   json::value(json::object{{"attestation_mode", "tpm"}})),
               std::runtime_error);
  EXPECT_THROW(json::value_to<aigate::AigateConfig>(
                   json::value(json::object{{"timeout_seconds", 0}})),
               std::runtime_error);
  EXPECT_THROW(json::value_to<aigate::AigateConfig>(json::value("x")),
               std::runtime_error);
}

TEST(AigateConfigTest, BaseUrlResolution) {
  aigate::AigateConfig cfg;
  EXPECT_EQ(cfg.resolved_base_url(), aigate::kProductionBaseUrl);
  cfg.base_url = "http://127.0.0.1:8080";
  EXPECT_EQ(cfg.resolved_base_url(), "http://127.0.0.1:8080");
  cfg.base_url.clear();
  cfg.environment = aigate::Environment::Custom;
  EXPECT_THROW(cfg.resolved_base_url(), std::runtime_error);
  EXPECT_STREQ(aigate::environment_tag(aigate::Environment::Custom), "test");
}

} // namespace
