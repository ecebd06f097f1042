/*
 * 설명: Boost.Beast + OpenSSL로 Gemini generateContent를 동기 호출한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/llm_provider_test.cpp
 */
#include "mystery/llm_provider.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace mystery {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;

nlohmann::json BuildGenerateContentBody(const std::string& prompt, double temperature) {
  return {{"contents", nlohmann::json::array({{{"role", "user"}, {"parts", nlohmann::json::array({{{"text", prompt}}})}}})},
          {"generationConfig", {{"temperature", temperature}}}};
}

std::string ExtractGeneratedText(const nlohmann::json& response) {
  auto candidates = response.find("candidates");
  if (candidates == response.end() || !candidates->is_array() || candidates->empty()) {
    throw ProviderError("응답에 candidates가 없습니다");
  }
  const auto& first = candidates->front();
  if (!first.contains("content") || !first["content"].contains("parts") || !first["content"]["parts"].is_array()) {
    throw ProviderError("응답 형식이 올바르지 않습니다");
  }
  std::string text;
  for (const auto& part : first["content"]["parts"]) {
    if (part.contains("text") && part["text"].is_string()) {
      text += part["text"].get<std::string>();
    }
  }
  if (text.empty()) {
    throw ProviderError("응답 본문이 비어 있습니다");
  }
  return text;
}

GeminiProvider::GeminiProvider(GeminiConfig config) : config_(std::move(config)) {}

std::string GeminiProvider::Generate(const std::string& prompt) {
  if (config_.api_key.empty()) {
    throw ProviderError("LLM API 키가 설정되지 않았습니다");
  }

  try {
    net::io_context ioc;
    ssl::context ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    net::ip::tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), config_.host.c_str())) {
      beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
      throw beast::system_error{ec};
    }
    stream.set_verify_callback(ssl::host_name_verification(config_.host));

    auto const results = resolver.resolve(config_.host, config_.port);
    beast::get_lowest_layer(stream).expires_after(config_.timeout);
    beast::get_lowest_layer(stream).connect(results);
    stream.handshake(ssl::stream_base::client);

    http::request<http::string_body> req{http::verb::post, "/v1beta/models/" + config_.model + ":generateContent",
                                         11};
    req.set(http::field::host, config_.host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::content_type, "application/json");
    req.set("x-goog-api-key", config_.api_key);
    req.body() = BuildGenerateContentBody(prompt, config_.temperature).dump();
    req.prepare_payload();

    http::write(stream, req);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.shutdown(ec);
    // 상대가 close_notify 없이 끊는 경우는 정상 종료로 본다.
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
      throw beast::system_error{ec};
    }

    if (res.result() != http::status::ok) {
      throw ProviderError("LLM 응답 상태 오류: " + std::to_string(res.result_int()));
    }
    return ExtractGeneratedText(nlohmann::json::parse(res.body()));
  } catch (const ProviderError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ProviderError(std::string("LLM 호출 실패: ") + ex.what());
  }
}

}  // namespace mystery
