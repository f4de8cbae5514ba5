/*
 * 설명: 그룹 이름 → 구독 연결 집합을 관리하는 그룹 레지스트리와 연결별 가입 목록을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/group_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dispatch {

inline constexpr const char* kDriverPoolGroup = "drivers";

class Connection {
 public:
  virtual ~Connection() = default;
  virtual const std::string& ConnectionId() const = 0;
  // 어느 스레드에서든 호출될 수 있다.
  virtual void Deliver(std::string frame) = 0;
};

class GroupRegistry {
 public:
  virtual ~GroupRegistry() = default;

  virtual void Join(const std::string& group, const std::shared_ptr<Connection>& connection) = 0;
  virtual void Leave(const std::string& group, const std::string& connection_id) = 0;
  // 전달한 연결 수를 반환한다. 멤버가 없으면 0.
  virtual std::size_t Send(const std::string& group, const std::string& frame) = 0;
  virtual void SendToConnection(Connection& connection, const std::string& frame) = 0;

  virtual std::size_t MemberCount(const std::string& group) const = 0;
  virtual bool IsMember(const std::string& group, const std::string& connection_id) const = 0;
  virtual std::size_t GroupCount() const = 0;
};

class InMemoryGroupRegistry : public GroupRegistry {
 public:
  explicit InMemoryGroupRegistry(std::set<std::string> pinned_groups = {kDriverPoolGroup});

  void Join(const std::string& group, const std::shared_ptr<Connection>& connection) override;
  void Leave(const std::string& group, const std::string& connection_id) override;
  std::size_t Send(const std::string& group, const std::string& frame) override;
  void SendToConnection(Connection& connection, const std::string& frame) override;

  std::size_t MemberCount(const std::string& group) const override;
  bool IsMember(const std::string& group, const std::string& connection_id) const override;
  std::size_t GroupCount() const override;

 private:
  struct Group {
    std::mutex mutex;
    std::unordered_map<std::string, std::weak_ptr<Connection>> members;
    // 테이블에서 제거된 뒤에는 가입을 받지 않는다.
    bool retired{false};
  };

  std::shared_ptr<Group> Find(const std::string& name) const;
  std::shared_ptr<Group> FindOrCreate(const std::string& name);
  void PruneIfEmpty(const std::string& name, const std::shared_ptr<Group>& group);

  std::set<std::string> pinned_;
  std::unordered_map<std::string, std::shared_ptr<Group>> groups_;
  mutable std::shared_mutex table_mutex_;
};

// 한 연결이 가입한 그룹 목록. 연결의 strand 안에서만 사용한다.
class GroupMembership {
 public:
  GroupMembership(std::shared_ptr<GroupRegistry> registry, std::string connection_id);

  void Join(const std::string& group, const std::shared_ptr<Connection>& connection);
  void Leave(const std::string& group);
  void LeaveAll();
  bool Contains(const std::string& group) const { return groups_.count(group) > 0; }
  std::vector<std::string> Groups() const;

  GroupRegistry& Registry() { return *registry_; }

 private:
  std::shared_ptr<GroupRegistry> registry_;
  std::string connection_id_;
  std::set<std::string> groups_;
};

}  // namespace dispatch
