/*
 * 설명: JSON 응답 엔벨로프와 WebSocket 메시지 엔벨로프를 생성하고 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "dispatch/api_response.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace dispatch {

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json ToWsJson(const WsMessage& message) { return {{"type", message.type}, {"data", message.data}}; }

nlohmann::json MakeWsError(std::string_view code, std::string_view message, bool retryable) {
  return {{"type", "error"}, {"data", {{"code", code}, {"message", message}, {"retryable", retryable}}}};
}

std::optional<WsMessage> ParseWsMessage(const std::string& raw, std::string& error_code, std::string& error_message) {
  auto json = nlohmann::json::parse(raw, nullptr, false);
  if (json.is_discarded()) {
    error_code = "bad_request";
    error_message = "JSON 파싱 오류";
    return std::nullopt;
  }
  if (!json.is_object()) {
    error_code = "bad_request";
    error_message = "메시지는 JSON 객체여야 합니다";
    return std::nullopt;
  }
  auto type_it = json.find("type");
  if (type_it == json.end() || !type_it->is_string() || type_it->get<std::string>().empty()) {
    error_code = "bad_request";
    error_message = "type 필드가 필요합니다";
    return std::nullopt;
  }
  WsMessage message;
  message.type = type_it->get<std::string>();
  auto data_it = json.find("data");
  message.data = data_it == json.end() ? nlohmann::json(nullptr) : *data_it;
  auto group_it = json.find("group");
  if (group_it != json.end()) {
    if (!group_it->is_string() || group_it->get<std::string>().empty()) {
      error_code = "bad_request";
      error_message = "group 필드는 비어 있지 않은 문자열이어야 합니다";
      return std::nullopt;
    }
    message.group = group_it->get<std::string>();
  }
  return message;
}

}  // namespace dispatch
