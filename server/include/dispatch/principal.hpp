/*
 * 설명: 연결에 부착되는 인증 주체(Principal)와 역할별 생성 함수를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/model_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace dispatch {

enum class Role { kDriver, kRider, kOwner };

struct Principal {
  std::string id;
  std::string phone_number;
  std::string first_name;
  std::string last_name;
  Role role{Role::kRider};
  bool is_staff{false};
  bool is_active{true};
};

// 역할별 기본값(is_staff, is_active)은 생성 시점에 결정된다.
Principal MakeRider(std::string id, std::string phone_number);
Principal MakeDriver(std::string id, std::string phone_number);
Principal MakeOwner(std::string id, std::string phone_number);

std::string_view RoleName(Role role);
std::optional<Role> ParseRole(std::string_view name);

nlohmann::json PrincipalToJson(const Principal& principal);
std::optional<Principal> PrincipalFromJson(const nlohmann::json& json);

}  // namespace dispatch
