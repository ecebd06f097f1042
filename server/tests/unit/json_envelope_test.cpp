#include <stdexcept>

#include <gtest/gtest.h>

#include "mystery/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = mystery::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = mystery::MakeErrorEnvelope("bad_request", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "bad_request");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, WsMessageAlwaysCarriesPayloadObject) {
  auto msg = mystery::ToWsJson(mystery::WsEnvelope{.type = "player_left", .payload = nullptr});
  EXPECT_EQ(msg["type"], "player_left");
  EXPECT_TRUE(msg["payload"].is_object());
}

TEST(JsonEnvelopeTest, ParseWsEnvelopeDefaultsMissingPayload) {
  auto env = mystery::ParseWsEnvelope(nlohmann::json{{"type", "gm_request"}});
  EXPECT_EQ(env.type, "gm_request");
  EXPECT_TRUE(env.payload.is_object());
  EXPECT_TRUE(env.payload.empty());
}

TEST(JsonEnvelopeTest, ParseWsEnvelopeRejectsMalformedMessages) {
  EXPECT_THROW(mystery::ParseWsEnvelope(nlohmann::json::array()), std::invalid_argument);
  EXPECT_THROW(mystery::ParseWsEnvelope(nlohmann::json{{"payload", nlohmann::json::object()}}), std::invalid_argument);
  EXPECT_THROW(mystery::ParseWsEnvelope(nlohmann::json{{"type", 3}}), std::invalid_argument);
  EXPECT_THROW(mystery::ParseWsEnvelope(nlohmann::json{{"type", "chat"}, {"payload", "text"}}), std::invalid_argument);
}

TEST(JsonEnvelopeTest, IsoTimestampIsUtc) {
  auto text = mystery::ToIsoString(std::chrono::system_clock::time_point{});
  EXPECT_EQ(text, "1970-01-01T00:00:00Z");
}
