/*
 * 설명: HTTP 응답 엔벨로프와 WebSocket 메시지 엔벨로프({type, data}) 생성/파싱을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace dispatch {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

struct WsMessage {
  std::string type;
  nlohmann::json data;
  // 관리용 echo가 특정 그룹을 지정할 때만 채워진다.
  std::optional<std::string> group;
};

nlohmann::json ToWsJson(const WsMessage& message);
nlohmann::json MakeWsError(std::string_view code, std::string_view message, bool retryable = false);
std::optional<WsMessage> ParseWsMessage(const std::string& raw, std::string& error_code, std::string& error_message);

std::string ToIsoString(std::chrono::system_clock::time_point tp);

}  // namespace dispatch
