#include <gtest/gtest.h>

#include "mystery/llm_provider.hpp"

TEST(LlmProviderTest, RequestBodyCarriesPromptAndTemperature) {
  auto body = mystery::BuildGenerateContentBody("Describe the study", 0.7);
  ASSERT_TRUE(body["contents"].is_array());
  ASSERT_EQ(body["contents"].size(), 1u);
  EXPECT_EQ(body["contents"][0]["role"], "user");
  EXPECT_EQ(body["contents"][0]["parts"][0]["text"], "Describe the study");
  EXPECT_DOUBLE_EQ(body["generationConfig"]["temperature"].get<double>(), 0.7);
}

TEST(LlmProviderTest, ExtractJoinsAllTextParts) {
  nlohmann::json response = {
      {"candidates", {{{"content", {{"parts", {{{"text", "The candle "}}, {{"text", "flickers."}}}}}}}}}};
  EXPECT_EQ(mystery::ExtractGeneratedText(response), "The candle flickers.");
}

TEST(LlmProviderTest, ExtractRejectsMalformedResponses) {
  EXPECT_THROW(mystery::ExtractGeneratedText(nlohmann::json::object()), mystery::ProviderError);
  EXPECT_THROW(mystery::ExtractGeneratedText(nlohmann::json{{"candidates", nlohmann::json::array()}}),
               mystery::ProviderError);
  nlohmann::json no_parts = {{"candidates", {{{"content", nlohmann::json::object()}}}}};
  EXPECT_THROW(mystery::ExtractGeneratedText(no_parts), mystery::ProviderError);
  nlohmann::json empty_text = {{"candidates", {{{"content", {{"parts", {{{"text", ""}}}}}}}}}};
  EXPECT_THROW(mystery::ExtractGeneratedText(empty_text), mystery::ProviderError);
}

TEST(LlmProviderTest, MissingApiKeyFailsWithoutNetwork) {
  mystery::GeminiProvider provider(mystery::GeminiConfig{});
  EXPECT_THROW(provider.Generate("hello"), mystery::ProviderError);
}
