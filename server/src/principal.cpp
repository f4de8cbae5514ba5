/*
 * 설명: Principal 역할 변환과 JSON 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/model_test.cpp
 */
#include "dispatch/principal.hpp"

#include <utility>

namespace dispatch {
namespace {
Principal MakePrincipal(std::string id, std::string phone_number, Role role) {
  Principal principal;
  principal.id = std::move(id);
  principal.phone_number = std::move(phone_number);
  principal.role = role;
  principal.is_active = true;
  return principal;
}

std::optional<std::string> IdFromJson(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>());
  }
  return std::nullopt;
}
}  // namespace

Principal MakeRider(std::string id, std::string phone_number) {
  return MakePrincipal(std::move(id), std::move(phone_number), Role::kRider);
}

Principal MakeDriver(std::string id, std::string phone_number) {
  return MakePrincipal(std::move(id), std::move(phone_number), Role::kDriver);
}

Principal MakeOwner(std::string id, std::string phone_number) {
  auto principal = MakePrincipal(std::move(id), std::move(phone_number), Role::kOwner);
  // 차량 소유주는 운영 도구 접근 권한을 가진다.
  principal.is_staff = true;
  return principal;
}

std::string_view RoleName(Role role) {
  switch (role) {
    case Role::kDriver:
      return "DRIVER";
    case Role::kOwner:
      return "OWNER";
    case Role::kRider:
      break;
  }
  return "RIDER";
}

std::optional<Role> ParseRole(std::string_view name) {
  if (name == "DRIVER") {
    return Role::kDriver;
  }
  if (name == "RIDER") {
    return Role::kRider;
  }
  if (name == "OWNER") {
    return Role::kOwner;
  }
  return std::nullopt;
}

nlohmann::json PrincipalToJson(const Principal& principal) {
  return {{"id", principal.id},
          {"phone_number", principal.phone_number},
          {"first_name", principal.first_name},
          {"last_name", principal.last_name},
          {"type", RoleName(principal.role)}};
}

std::optional<Principal> PrincipalFromJson(const nlohmann::json& json) {
  if (!json.is_object() || !json.contains("id") || !json.contains("type") || !json["type"].is_string()) {
    return std::nullopt;
  }
  auto id = IdFromJson(json["id"]);
  auto role = ParseRole(json["type"].get<std::string>());
  if (!id || id->empty() || !role) {
    return std::nullopt;
  }
  std::string phone = json.value("phone_number", std::string{});
  Principal principal;
  switch (*role) {
    case Role::kDriver:
      principal = MakeDriver(*id, phone);
      break;
    case Role::kOwner:
      principal = MakeOwner(*id, phone);
      break;
    case Role::kRider:
      principal = MakeRider(*id, phone);
      break;
  }
  principal.first_name = json.value("first_name", std::string{});
  principal.last_name = json.value("last_name", std::string{});
  principal.is_active = json.value("is_active", true);
  return principal;
}

}  // namespace dispatch
