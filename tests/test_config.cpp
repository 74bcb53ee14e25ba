#include <gtest/gtest.h>
#include "config.hpp"

#include <cstdlib>

using chatbot::ParseHttpEndpoint;

TEST(ConfigTest, ParsesEndpointWithDefaults) {
  auto ep = ParseHttpEndpoint("https://api.openai.com");
  EXPECT_EQ(ep.scheme, "https");
  EXPECT_EQ(ep.host, "api.openai.com");
  EXPECT_EQ(ep.port, 443);
  EXPECT_TRUE(ep.base_path.empty());

  auto local = ParseHttpEndpoint("http://127.0.0.1:9000/proxy/");
  EXPECT_EQ(local.scheme, "http");
  EXPECT_EQ(local.host, "127.0.0.1");
  EXPECT_EQ(local.port, 9000);
  EXPECT_EQ(local.base_path, "/proxy");
  EXPECT_EQ(chatbot::EndpointUrl(local), "http://127.0.0.1:9000/proxy");
}

TEST(ConfigTest, LoadsFromEnvironment) {
  setenv("OPENAI_API_KEY", "sk-env", 1);
  setenv("CHATBOT_WORKFLOW_ID", "wf_env", 1);
  setenv("CHATKIT_API_BASE", "http://localhost:8081", 1);
  setenv("CHATBOT_SESSION_TIMEOUT_S", "5", 1);
  setenv("CHATBOT_MESSAGE_TIMEOUT_S", "not-a-number", 1);

  auto cfg = chatbot::LoadConfigFromEnv();
  EXPECT_EQ(cfg.api_key, "sk-env");
  EXPECT_EQ(cfg.workflow_id, "wf_env");
  EXPECT_EQ(cfg.chatkit.host, "localhost");
  EXPECT_EQ(cfg.chatkit.port, 8081);
  EXPECT_EQ(cfg.fallback.host, "api.openai.com");
  EXPECT_EQ(cfg.timeouts.session_seconds, 5);
  EXPECT_EQ(cfg.timeouts.message_seconds, 60);
  EXPECT_EQ(cfg.fallback_model, "gpt-4o-mini");

  unsetenv("OPENAI_API_KEY");
  unsetenv("CHATBOT_WORKFLOW_ID");
  unsetenv("CHATKIT_API_BASE");
  unsetenv("CHATBOT_SESSION_TIMEOUT_S");
  unsetenv("CHATBOT_MESSAGE_TIMEOUT_S");
}

TEST(ConfigTest, MissingApiKeyStaysEmpty) {
  unsetenv("OPENAI_API_KEY");
  auto cfg = chatbot::LoadConfigFromEnv();
  EXPECT_TRUE(cfg.api_key.empty());
  EXPECT_EQ(cfg.workflow_id, chatbot::kDefaultWorkflowId);
}

TEST(ConfigTest, ApiKeyIsTrimmed) {
  setenv("OPENAI_API_KEY", "  sk-env \n", 1);
  EXPECT_EQ(chatbot::LoadConfigFromEnv().api_key, "sk-env");
  setenv("OPENAI_API_KEY", " \t\n", 1);
  EXPECT_TRUE(chatbot::LoadConfigFromEnv().api_key.empty());
  unsetenv("OPENAI_API_KEY");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
