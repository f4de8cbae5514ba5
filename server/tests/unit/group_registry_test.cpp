#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "dispatch/group_registry.hpp"
#include "recording_connection.hpp"

TEST(GroupRegistryTest, JoinIsIdempotent) {
  dispatch::InMemoryGroupRegistry registry;
  auto conn = std::make_shared<RecordingConnection>("c1");
  registry.Join("trip-1", conn);
  registry.Join("trip-1", conn);
  EXPECT_EQ(registry.MemberCount("trip-1"), 1u);
  EXPECT_EQ(registry.Send("trip-1", "hello"), 1u);
  EXPECT_EQ(conn->Count(), 1u);
}

TEST(GroupRegistryTest, LeaveUnknownIsNoOp) {
  dispatch::InMemoryGroupRegistry registry;
  EXPECT_NO_THROW(registry.Leave("trip-x", "nobody"));
  auto conn = std::make_shared<RecordingConnection>("c1");
  registry.Join("trip-1", conn);
  EXPECT_NO_THROW(registry.Leave("trip-1", "nobody"));
  EXPECT_EQ(registry.MemberCount("trip-1"), 1u);
}

TEST(GroupRegistryTest, SendToEmptyGroupIsSilent) {
  dispatch::InMemoryGroupRegistry registry;
  EXPECT_EQ(registry.Send("missing", "frame"), 0u);
  EXPECT_EQ(registry.Send(dispatch::kDriverPoolGroup, "frame"), 0u);
}

TEST(GroupRegistryTest, FanOutReachesOnlyMembers) {
  dispatch::InMemoryGroupRegistry registry;
  auto a = std::make_shared<RecordingConnection>("a");
  auto b = std::make_shared<RecordingConnection>("b");
  auto outsider = std::make_shared<RecordingConnection>("o");
  registry.Join("trip-1", a);
  registry.Join("trip-1", b);
  registry.Join("trip-2", outsider);

  EXPECT_EQ(registry.Send("trip-1", "update"), 2u);
  EXPECT_EQ(a->Frames(), std::vector<std::string>{"update"});
  EXPECT_EQ(b->Frames(), std::vector<std::string>{"update"});
  EXPECT_EQ(outsider->Count(), 0u);
}

TEST(GroupRegistryTest, EmptyTripGroupsArePrunedAndReusable) {
  dispatch::InMemoryGroupRegistry registry;
  EXPECT_EQ(registry.GroupCount(), 1u);
  auto conn = std::make_shared<RecordingConnection>("c1");
  registry.Join("trip-1", conn);
  EXPECT_EQ(registry.GroupCount(), 2u);
  registry.Leave("trip-1", "c1");
  EXPECT_EQ(registry.GroupCount(), 1u);
  EXPECT_FALSE(registry.IsMember("trip-1", "c1"));

  registry.Join("trip-1", conn);
  EXPECT_TRUE(registry.IsMember("trip-1", "c1"));
  EXPECT_EQ(registry.Send("trip-1", "again"), 1u);
}

TEST(GroupRegistryTest, PinnedDriverPoolSurvivesLastLeave) {
  dispatch::InMemoryGroupRegistry registry;
  auto driver = std::make_shared<RecordingConnection>("d1");
  registry.Join(dispatch::kDriverPoolGroup, driver);
  registry.Leave(dispatch::kDriverPoolGroup, "d1");
  EXPECT_EQ(registry.GroupCount(), 1u);
  EXPECT_EQ(registry.MemberCount(dispatch::kDriverPoolGroup), 0u);
}

TEST(GroupRegistryTest, DroppedConnectionsAreNotKeptAlive) {
  dispatch::InMemoryGroupRegistry registry;
  auto keeper = std::make_shared<RecordingConnection>("keep");
  registry.Join("trip-1", keeper);
  {
    auto dropped = std::make_shared<RecordingConnection>("gone");
    registry.Join("trip-1", dropped);
    std::weak_ptr<RecordingConnection> watch = dropped;
    dropped.reset();
    EXPECT_TRUE(watch.expired());
  }
  EXPECT_EQ(registry.Send("trip-1", "frame"), 1u);
  EXPECT_EQ(registry.MemberCount("trip-1"), 1u);
}

TEST(GroupRegistryTest, DirectSendBypassesGroups) {
  dispatch::InMemoryGroupRegistry registry;
  RecordingConnection conn("c1");
  registry.SendToConnection(conn, "direct");
  EXPECT_EQ(conn.Frames(), std::vector<std::string>{"direct"});
}

TEST(GroupMembershipTest, LeaveAllClearsEveryGroup) {
  auto registry = std::make_shared<dispatch::InMemoryGroupRegistry>();
  auto conn = std::make_shared<RecordingConnection>("c1");
  dispatch::GroupMembership membership(registry, "c1");
  membership.Join(dispatch::kDriverPoolGroup, conn);
  membership.Join("trip-1", conn);
  membership.Join("trip-2", conn);
  EXPECT_TRUE(membership.Contains("trip-1"));
  EXPECT_EQ(membership.Groups().size(), 3u);

  membership.Leave("trip-2");
  EXPECT_FALSE(registry->IsMember("trip-2", "c1"));

  membership.LeaveAll();
  EXPECT_TRUE(membership.Groups().empty());
  EXPECT_FALSE(registry->IsMember(dispatch::kDriverPoolGroup, "c1"));
  EXPECT_FALSE(registry->IsMember("trip-1", "c1"));
  EXPECT_EQ(registry->GroupCount(), 1u);
}

TEST(GroupRegistryTest, ConcurrentJoinLeaveSendKeepsMembershipConsistent) {
  dispatch::InMemoryGroupRegistry registry;
  constexpr int kThreads = 8;
  constexpr int kRounds = 500;
  std::vector<std::shared_ptr<RecordingConnection>> connections;
  for (int i = 0; i < kThreads; ++i) {
    connections.push_back(std::make_shared<RecordingConnection>("c" + std::to_string(i)));
  }
  auto stable = std::make_shared<RecordingConnection>("stable");
  registry.Join("shared", stable);

  std::atomic<bool> start{false};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      while (!start.load()) {
        std::this_thread::yield();
      }
      auto& conn = connections[t];
      const std::string own_group = "trip-" + std::to_string(t % 3);
      for (int i = 0; i < kRounds; ++i) {
        registry.Join(own_group, conn);
        registry.Join("shared", conn);
        registry.Send("shared", "x");
        registry.Send(own_group, "y");
        registry.Leave(own_group, conn->ConnectionId());
        registry.Leave("shared", conn->ConnectionId());
      }
    });
  }
  start = true;
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(stable->Count(), static_cast<std::size_t>(kThreads * kRounds));
  EXPECT_EQ(registry.MemberCount("shared"), 1u);
  for (int g = 0; g < 3; ++g) {
    EXPECT_EQ(registry.MemberCount("trip-" + std::to_string(g)), 0u);
  }
  // drivers 고정 그룹과 stable이 남은 shared 그룹.
  EXPECT_EQ(registry.GroupCount(), 2u);
}
