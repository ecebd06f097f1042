/*
 * 설명: 언어 모델 제공자 인터페이스와 Gemini generateContent HTTPS 클라이언트를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/narrative_test.cpp, server/tests/unit/llm_provider_test.cpp
 */
#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace mystery {

class ProviderError : public std::runtime_error {
 public:
  explicit ProviderError(const std::string& message) : std::runtime_error(message) {}
};

class LanguageModelProvider {
 public:
  virtual ~LanguageModelProvider() = default;
  // 실패 시 예외를 던진다.
  virtual std::string Generate(const std::string& prompt) = 0;
};

struct GeminiConfig {
  std::string host{"generativelanguage.googleapis.com"};
  std::string port{"443"};
  std::string model{"gemini-2.0-flash-exp"};
  std::string api_key;
  double temperature{0.7};
  std::chrono::seconds timeout{30};
};

class GeminiProvider : public LanguageModelProvider {
 public:
  explicit GeminiProvider(GeminiConfig config);

  std::string Generate(const std::string& prompt) override;

 private:
  GeminiConfig config_;
};

nlohmann::json BuildGenerateContentBody(const std::string& prompt, double temperature);
// candidates[0].content.parts[*].text를 이어 붙인다. 형식이 맞지 않으면 ProviderError.
std::string ExtractGeneratedText(const nlohmann::json& response);

}  // namespace mystery
