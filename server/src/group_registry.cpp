/*
 * 설명: 그룹별 뮤텍스로 보호되는 인메모리 그룹 레지스트리와 연결별 가입 목록을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/group_registry_test.cpp
 */
#include "dispatch/group_registry.hpp"

namespace dispatch {

InMemoryGroupRegistry::InMemoryGroupRegistry(std::set<std::string> pinned_groups)
    : pinned_(std::move(pinned_groups)) {
  for (const auto& name : pinned_) {
    groups_.emplace(name, std::make_shared<Group>());
  }
}

std::shared_ptr<InMemoryGroupRegistry::Group> InMemoryGroupRegistry::Find(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(table_mutex_);
  auto it = groups_.find(name);
  if (it == groups_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<InMemoryGroupRegistry::Group> InMemoryGroupRegistry::FindOrCreate(const std::string& name) {
  if (auto group = Find(name)) {
    return group;
  }
  std::unique_lock<std::shared_mutex> lock(table_mutex_);
  auto [it, inserted] = groups_.try_emplace(name, nullptr);
  if (inserted) {
    it->second = std::make_shared<Group>();
  }
  return it->second;
}

void InMemoryGroupRegistry::PruneIfEmpty(const std::string& name, const std::shared_ptr<Group>& group) {
  if (pinned_.count(name) > 0) {
    return;
  }
  // 잠금 순서: 테이블 → 그룹.
  std::unique_lock<std::shared_mutex> table_lock(table_mutex_);
  auto it = groups_.find(name);
  if (it == groups_.end() || it->second != group) {
    return;
  }
  std::lock_guard<std::mutex> group_lock(group->mutex);
  if (!group->members.empty()) {
    return;
  }
  group->retired = true;
  groups_.erase(it);
}

void InMemoryGroupRegistry::Join(const std::string& group_name, const std::shared_ptr<Connection>& connection) {
  if (!connection) {
    return;
  }
  for (;;) {
    auto group = FindOrCreate(group_name);
    std::lock_guard<std::mutex> lock(group->mutex);
    if (group->retired) {
      // 가지치기와 경합했다. 새 그룹 항목으로 다시 시도한다.
      continue;
    }
    group->members[connection->ConnectionId()] = connection;
    return;
  }
}

void InMemoryGroupRegistry::Leave(const std::string& group_name, const std::string& connection_id) {
  auto group = Find(group_name);
  if (!group) {
    return;
  }
  bool empty = false;
  {
    std::lock_guard<std::mutex> lock(group->mutex);
    if (group->members.erase(connection_id) == 0) {
      return;
    }
    empty = group->members.empty();
  }
  if (empty) {
    PruneIfEmpty(group_name, group);
  }
}

std::size_t InMemoryGroupRegistry::Send(const std::string& group_name, const std::string& frame) {
  auto group = Find(group_name);
  if (!group) {
    return 0;
  }
  std::vector<std::shared_ptr<Connection>> targets;
  bool empty = false;
  {
    std::lock_guard<std::mutex> lock(group->mutex);
    targets.reserve(group->members.size());
    for (auto it = group->members.begin(); it != group->members.end();) {
      if (auto connection = it->second.lock()) {
        targets.push_back(std::move(connection));
        ++it;
      } else {
        it = group->members.erase(it);
      }
    }
    empty = group->members.empty();
  }
  // 전달은 그룹 잠금 밖에서 한다.
  for (const auto& connection : targets) {
    connection->Deliver(frame);
  }
  if (empty) {
    PruneIfEmpty(group_name, group);
  }
  return targets.size();
}

void InMemoryGroupRegistry::SendToConnection(Connection& connection, const std::string& frame) {
  connection.Deliver(frame);
}

std::size_t InMemoryGroupRegistry::MemberCount(const std::string& group_name) const {
  auto group = Find(group_name);
  if (!group) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(group->mutex);
  return group->members.size();
}

bool InMemoryGroupRegistry::IsMember(const std::string& group_name, const std::string& connection_id) const {
  auto group = Find(group_name);
  if (!group) {
    return false;
  }
  std::lock_guard<std::mutex> lock(group->mutex);
  return group->members.count(connection_id) > 0;
}

std::size_t InMemoryGroupRegistry::GroupCount() const {
  std::shared_lock<std::shared_mutex> lock(table_mutex_);
  return groups_.size();
}

GroupMembership::GroupMembership(std::shared_ptr<GroupRegistry> registry, std::string connection_id)
    : registry_(std::move(registry)), connection_id_(std::move(connection_id)) {}

void GroupMembership::Join(const std::string& group, const std::shared_ptr<Connection>& connection) {
  registry_->Join(group, connection);
  groups_.insert(group);
}

void GroupMembership::Leave(const std::string& group) {
  registry_->Leave(group, connection_id_);
  groups_.erase(group);
}

void GroupMembership::LeaveAll() {
  for (const auto& group : groups_) {
    registry_->Leave(group, connection_id_);
  }
  groups_.clear();
}

std::vector<std::string> GroupMembership::Groups() const { return {groups_.begin(), groups_.end()}; }

}  // namespace dispatch
