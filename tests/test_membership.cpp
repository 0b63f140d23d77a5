/**
 * @file test_membership.cpp
 * @brief Tests for MembershipRegistry classification, bindings and lifecycle.
 *
 * Validates:
 *  - Bridge discoveries/losses/health failures reach the bridge pool
 *  - First-wins singleton bindings, rebinding after loss, idempotent loss
 *  - Server identity version tracking
 *  - Lifecycle errors (before init, after dispose) and configuration errors
 *  - Collaborator exceptions propagate and never leave the registry locked
 *  - Readers observe whole Bindings generations under a concurrent writer
 */

#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "roster/membership/bridge_registry.hpp"
#include "roster/membership/capability_matcher.hpp"
#include "roster/membership/membership_registry.hpp"

using roster::config::MembershipConfig;
using roster::membership::BridgePool;
using roster::membership::BridgeRegistry;
using roster::membership::CapabilitySet;
using roster::membership::Detector;
using roster::membership::DetectorFactory;
using roster::membership::DetectorKind;
using roster::membership::MembershipDeps;
using roster::membership::MembershipErr;
using roster::membership::MembershipRegistry;
using roster::membership::NodeAddress;
using roster::membership::NodeAddressHash;
using roster::membership::Role;
using roster::membership::VersionInfo;
using roster::membership::required_features;
using roster::obs::ChangeEvent;
using roster::obs::ChangeKind;

namespace {

// ---------------------------- Test doubles ---------------------------------

/// Bridge pool that records every call it receives.
class RecordingBridgePool final : public BridgePool {
public:
  void init() override { ++inits; }
  void dispose() override { ++disposes; members.clear(); }

  void add(const NodeAddress& a, const std::optional<VersionInfo>& v) override {
    if (throw_on_add) throw std::runtime_error("pool add failed");
    if (on_add) on_add();
    added.push_back(a);
    members.insert(a);
    if (v) versions[a.value] = *v;
  }
  void remove(const NodeAddress& a) override {
    removed.push_back(a);
    members.erase(a);
    versions.erase(a.value);
  }
  bool contains(const NodeAddress& a) const override { return members.count(a) != 0; }
  std::optional<VersionInfo> lookupVersion(const NodeAddress& a) const override {
    auto it = versions.find(a.value);
    if (it == versions.end()) return std::nullopt;
    return it->second;
  }

  int inits{0}, disposes{0};
  bool throw_on_add{false};
  std::function<void()> on_add;
  std::vector<NodeAddress> added, removed;
  std::unordered_set<NodeAddress, NodeAddressHash> members;
  std::unordered_map<std::string, VersionInfo> versions;
};

/// Observer keeping every event in memory.
class RecordingObserver final : public roster::obs::Observer {
public:
  void record(const ChangeEvent& e) override {
    std::lock_guard<std::mutex> lk(mu);
    roster::obs::count(ctr, e.kind);
    events.push_back(e);
  }
  roster::obs::Counters snapshot() const override {
    std::lock_guard<std::mutex> lk(mu);
    return ctr;
  }
  mutable std::mutex mu;
  roster::obs::Counters ctr;
  std::vector<ChangeEvent> events;
};

/// Shared journal so tests can check init/dispose ordering across detectors.
struct DetectorJournal {
  std::vector<std::string> lines;
};

class FakeDetector final : public Detector {
public:
  FakeDetector(DetectorKind k, std::string b, DetectorJournal& j, bool fail_init, bool fail_dispose)
      : kind_(k), brewery_(std::move(b)), journal_(j),
        fail_init_(fail_init), fail_dispose_(fail_dispose) {}
  void init() override {
    if (fail_init_) throw std::runtime_error("brewery unreachable");
    journal_.lines.push_back(std::string("init ") + roster::membership::to_string(kind_));
  }
  void dispose() override {
    journal_.lines.push_back(std::string("dispose ") + roster::membership::to_string(kind_));
    if (fail_dispose_) throw std::runtime_error("brewery leave failed");
  }
  DetectorKind kind() const noexcept override { return kind_; }
  const std::string& brewery() const noexcept override { return brewery_; }
private:
  DetectorKind kind_;
  std::string brewery_;
  DetectorJournal& journal_;
  bool fail_init_;
  bool fail_dispose_;
};

class FakeDetectorFactory final : public DetectorFactory {
public:
  std::unique_ptr<Detector> create(DetectorKind k, const std::string& brewery) override {
    if (refuse && *refuse == k) return nullptr;
    const bool fail = fail_init && *fail_init == k;
    const bool fail_d = fail_dispose && *fail_dispose == k;
    return std::make_unique<FakeDetector>(k, brewery, journal, fail, fail_d);
  }
  std::optional<DetectorKind> refuse;
  std::optional<DetectorKind> fail_init;
  std::optional<DetectorKind> fail_dispose;
  DetectorJournal journal;
};

CapabilitySet features_of(Role role) {
  CapabilitySet caps;
  for (auto f : required_features(role)) caps.emplace(f);
  return caps;
}

const CapabilitySet kBridge = features_of(Role::BridgeNode);
const CapabilitySet kSipGw  = features_of(Role::SipGateway);
const CapabilitySet kMuc    = features_of(Role::RoomService);

constexpr const char* kServer = "meet.example.com";

/// Registry + recording collaborators, initialised with a server identity.
struct RegistryFixture : ::testing::Test {
  std::shared_ptr<RecordingBridgePool> pool = std::make_shared<RecordingBridgePool>();
  RecordingObserver observer;
  MembershipRegistry reg{MembershipDeps{pool, nullptr, &observer}};

  void SetUp() override {
    MembershipConfig cfg;
    cfg.server_identity = kServer;
    ASSERT_TRUE(reg.init(cfg).has_value());
  }

  std::size_t count_of(ChangeKind k) const {
    std::size_t n = 0;
    for (const auto& e : observer.events) if (e.kind == k) ++n;
    return n;
  }
};

} // namespace

// --------------------------- Unset accessors -------------------------------

/**
 * @test Fresh_Registry_Reports_Unset
 * @brief Before any discovery every accessor returns the unset value.
 */
TEST_F(RegistryFixture, Fresh_Registry_Reports_Unset) {
  EXPECT_FALSE(reg.getSipGateway().has_value());
  EXPECT_FALSE(reg.getRoomService().has_value());
  EXPECT_FALSE(reg.getServerVersion().has_value());
  EXPECT_EQ(reg.bindings()->generation, 0u);
}

TEST(MembershipRegistry, Accessors_Safe_Before_Init) {
  MembershipRegistry reg{MembershipDeps{}};
  EXPECT_FALSE(reg.getSipGateway().has_value());
  EXPECT_FALSE(reg.getRoomService().has_value());
  EXPECT_FALSE(reg.getServerVersion().has_value());
  EXPECT_FALSE(reg.getBridgeVersion("jvb.example.com").has_value());
  EXPECT_EQ(reg.detector(DetectorKind::Recorder), nullptr);
}

// --------------------------- Bridges ---------------------------------------

/**
 * @test Bridge_Discovery_Forwarded
 * @brief A bridge feature set is forwarded to the pool with its address and version.
 */
TEST_F(RegistryFixture, Bridge_Discovery_Forwarded) {
  const VersionInfo v{"JVB", "2.3.1", "linux"};
  ASSERT_TRUE(reg.onNodeDiscovered("jvb1.example.com", kBridge, v));

  ASSERT_EQ(pool->added.size(), 1u);
  EXPECT_EQ(pool->added[0], NodeAddress("jvb1.example.com"));
  EXPECT_EQ(reg.getBridgeVersion("jvb1.example.com"), v);
  EXPECT_FALSE(reg.getSipGateway().has_value());
  EXPECT_FALSE(reg.getRoomService().has_value());
  EXPECT_EQ(count_of(ChangeKind::BridgeForwarded), 1u);
}

/**
 * @test Bridge_Duplicate_Discovery_Forwarded_Again
 * @brief Bridges are multi-valued; every discovery is forwarded, no local dedupe.
 */
TEST_F(RegistryFixture, Bridge_Duplicate_Discovery_Forwarded_Again) {
  ASSERT_TRUE(reg.onNodeDiscovered("jvb1.example.com", kBridge, std::nullopt));
  ASSERT_TRUE(reg.onNodeDiscovered("jvb1.example.com", kBridge, std::nullopt));
  ASSERT_TRUE(reg.onNodeDiscovered("jvb2.example.com", kBridge, std::nullopt));
  EXPECT_EQ(pool->added.size(), 3u);
  EXPECT_EQ(pool->members.size(), 2u);
}

/**
 * @test Bridge_Beats_SipGateway
 * @brief A node advertising bridge and SIP gateway features is only a bridge.
 */
TEST_F(RegistryFixture, Bridge_Beats_SipGateway) {
  CapabilitySet both = kBridge;
  both.insert(kSipGw.begin(), kSipGw.end());
  ASSERT_TRUE(reg.onNodeDiscovered("hybrid.example.com", both, std::nullopt));
  EXPECT_EQ(pool->added.size(), 1u);
  EXPECT_FALSE(reg.getSipGateway().has_value());
}

TEST_F(RegistryFixture, Bridge_Lost_Removed_From_Pool) {
  ASSERT_TRUE(reg.onNodeDiscovered("jvb1.example.com", kBridge, std::nullopt));
  ASSERT_TRUE(reg.onNodeLost("jvb1.example.com"));
  ASSERT_EQ(pool->removed.size(), 1u);
  EXPECT_EQ(pool->removed[0], NodeAddress("jvb1.example.com"));
  EXPECT_FALSE(pool->contains("jvb1.example.com"));
}

/**
 * @test HealthFailure_Always_Forwarded
 * @brief Health failures reach the pool even for addresses it never saw and
 *        never touch singleton bindings.
 */
TEST_F(RegistryFixture, HealthFailure_Always_Forwarded) {
  ASSERT_TRUE(reg.onNodeDiscovered("jigasi.example.com", kSipGw, std::nullopt));

  ASSERT_TRUE(reg.onHealthCheckFailed("jigasi.example.com"));
  ASSERT_TRUE(reg.onHealthCheckFailed("never-seen.example.com"));

  ASSERT_EQ(pool->removed.size(), 2u);
  EXPECT_EQ(pool->removed[0], NodeAddress("jigasi.example.com"));
  EXPECT_EQ(pool->removed[1], NodeAddress("never-seen.example.com"));
  EXPECT_EQ(reg.getSipGateway(), NodeAddress("jigasi.example.com"));
  EXPECT_EQ(count_of(ChangeKind::HealthEviction), 2u);
}

// --------------------------- Singleton roles -------------------------------

/**
 * @test SipGateway_First_Wins
 * @brief A second gateway is ignored (not an error) while the first is bound.
 *        Whether this is duplicate-broadcast tolerance or a masked conflict is
 *        open; the ignored discovery is surfaced as ConflictIgnored.
 */
TEST_F(RegistryFixture, SipGateway_First_Wins) {
  ASSERT_TRUE(reg.onNodeDiscovered("gw-a.example.com", kSipGw, std::nullopt));
  ASSERT_TRUE(reg.onNodeDiscovered("gw-b.example.com", kSipGw, std::nullopt));

  EXPECT_EQ(reg.getSipGateway(), NodeAddress("gw-a.example.com"));
  EXPECT_EQ(count_of(ChangeKind::Bound), 1u);
  EXPECT_EQ(count_of(ChangeKind::ConflictIgnored), 1u);
}

TEST_F(RegistryFixture, SipGateway_Rebind_After_Loss) {
  ASSERT_TRUE(reg.onNodeDiscovered("gw-a.example.com", kSipGw, std::nullopt));
  ASSERT_TRUE(reg.onNodeLost("gw-a.example.com"));
  EXPECT_FALSE(reg.getSipGateway().has_value());
  ASSERT_TRUE(reg.onNodeDiscovered("gw-b.example.com", kSipGw, std::nullopt));

  EXPECT_EQ(reg.getSipGateway(), NodeAddress("gw-b.example.com"));
  EXPECT_EQ(count_of(ChangeKind::Unbound), 1u);
}

TEST_F(RegistryFixture, SipGateway_Same_Address_Rediscovery_Is_NoOp) {
  ASSERT_TRUE(reg.onNodeDiscovered("gw-a.example.com", kSipGw, std::nullopt));
  const auto gen = reg.bindings()->generation;
  ASSERT_TRUE(reg.onNodeDiscovered("gw-a.example.com", kSipGw, std::nullopt));

  EXPECT_EQ(reg.bindings()->generation, gen);
  EXPECT_EQ(count_of(ChangeKind::Bound), 1u);
  EXPECT_EQ(count_of(ChangeKind::ConflictIgnored), 0u);
}

/**
 * @test RoomService_First_Discovery_Binds
 * @brief The MUC feature binds the room service; a second MUC node is ignored.
 */
TEST_F(RegistryFixture, RoomService_First_Discovery_Binds) {
  CapabilitySet muc{"http://jabber.org/protocol/muc"};
  ASSERT_TRUE(reg.onNodeDiscovered("conference.example.com", muc, std::nullopt));
  EXPECT_EQ(reg.getRoomService(), NodeAddress("conference.example.com"));

  ASSERT_TRUE(reg.onNodeDiscovered("muc2.example.com", muc, std::nullopt));
  EXPECT_EQ(reg.getRoomService(), NodeAddress("conference.example.com"));
}

/**
 * @test Held_SipGateway_Falls_Through_To_RoomService
 * @brief A node refused as second gateway can still take the unbound room role.
 */
TEST_F(RegistryFixture, Held_SipGateway_Falls_Through_To_RoomService) {
  CapabilitySet gw_and_muc = kSipGw;
  gw_and_muc.insert(kMuc.begin(), kMuc.end());

  ASSERT_TRUE(reg.onNodeDiscovered("gw-a.example.com", kSipGw, std::nullopt));
  ASSERT_TRUE(reg.onNodeDiscovered("combo.example.com", gw_and_muc, std::nullopt));

  EXPECT_EQ(reg.getSipGateway(), NodeAddress("gw-a.example.com"));
  EXPECT_EQ(reg.getRoomService(), NodeAddress("combo.example.com"));
}

TEST_F(RegistryFixture, Unbound_SipGateway_Claims_Combined_Node) {
  CapabilitySet gw_and_muc = kSipGw;
  gw_and_muc.insert(kMuc.begin(), kMuc.end());

  ASSERT_TRUE(reg.onNodeDiscovered("combo.example.com", gw_and_muc, std::nullopt));
  EXPECT_EQ(reg.getSipGateway(), NodeAddress("combo.example.com"));
  EXPECT_FALSE(reg.getRoomService().has_value());
}

// --------------------------- Loss handling ---------------------------------

/**
 * @test Loss_Of_Unknown_Address_Changes_Nothing
 * @brief Loss for an address never discovered leaves bindings untouched.
 */
TEST_F(RegistryFixture, Loss_Of_Unknown_Address_Changes_Nothing) {
  ASSERT_TRUE(reg.onNodeDiscovered("gw-a.example.com", kSipGw, std::nullopt));
  ASSERT_TRUE(reg.onNodeDiscovered("conference.example.com", kMuc, std::nullopt));
  const auto before = *reg.bindings();

  ASSERT_TRUE(reg.onNodeLost("stranger.example.com"));
  ASSERT_TRUE(reg.onNodeLost("stranger.example.com"));

  EXPECT_EQ(*reg.bindings(), before);
  EXPECT_TRUE(pool->removed.empty());
}

/**
 * @test Loss_Handlers_Are_Independent
 * @brief One address bound as gateway and present in the pool loses both.
 */
TEST_F(RegistryFixture, Loss_Handlers_Are_Independent) {
  ASSERT_TRUE(reg.onNodeDiscovered("shared.example.com", kSipGw, std::nullopt));
  pool->members.insert(NodeAddress("shared.example.com")); // pool learned it elsewhere

  ASSERT_TRUE(reg.onNodeLost("shared.example.com"));

  EXPECT_FALSE(reg.getSipGateway().has_value());
  ASSERT_EQ(pool->removed.size(), 1u);
  EXPECT_EQ(pool->removed[0], NodeAddress("shared.example.com"));
}

TEST_F(RegistryFixture, Loss_Does_Not_Forward_Unknown_Bridge) {
  ASSERT_TRUE(reg.onNodeLost("jvb-unknown.example.com"));
  EXPECT_TRUE(pool->removed.empty());
}

// --------------------------- Server identity -------------------------------

TEST_F(RegistryFixture, ServerIdentity_Version_Recorded_And_Overwritten) {
  const VersionInfo v1{"Prosody", "0.11", "linux"};
  const VersionInfo v2{"Prosody", "0.12", "linux"};
  ASSERT_TRUE(reg.onNodeDiscovered(kServer, CapabilitySet{"jabber:iq:version"}, v1));
  EXPECT_EQ(reg.getServerVersion(), v1);

  ASSERT_TRUE(reg.onNodeDiscovered(kServer, CapabilitySet{}, v2));
  EXPECT_EQ(reg.getServerVersion(), v2);
  EXPECT_EQ(count_of(ChangeKind::ServerVersion), 2u);
}

TEST_F(RegistryFixture, ServerIdentity_Loss_Keeps_Version) {
  const VersionInfo v{"Prosody", "0.12", ""};
  ASSERT_TRUE(reg.onNodeDiscovered(kServer, CapabilitySet{}, v));
  ASSERT_TRUE(reg.onNodeLost(kServer));
  EXPECT_EQ(reg.getServerVersion(), v);
}

TEST_F(RegistryFixture, Other_Address_Without_Features_Is_Ignored) {
  ASSERT_TRUE(reg.onNodeDiscovered("pubsub.example.com",
                                   CapabilitySet{"http://jabber.org/protocol/pubsub"},
                                   VersionInfo{"x", "1", ""}));
  EXPECT_EQ(*reg.bindings(), roster::membership::Bindings{});
  EXPECT_TRUE(pool->added.empty());
  EXPECT_EQ(count_of(ChangeKind::Unrecognized), 1u);
}

// --------------------------- Lifecycle -------------------------------------

TEST(MembershipRegistry, Dispatch_Before_Init_Is_Reported) {
  auto pool = std::make_shared<RecordingBridgePool>();
  MembershipRegistry reg{MembershipDeps{pool, nullptr, nullptr}};

  auto r = reg.onNodeDiscovered("jvb1.example.com", kBridge, std::nullopt);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), MembershipErr::NotInitialized);
  EXPECT_TRUE(pool->added.empty());
}

TEST_F(RegistryFixture, Init_Twice_Is_Reported) {
  auto r = reg.init(MembershipConfig{});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), MembershipErr::AlreadyInitialized);
  EXPECT_EQ(pool->inits, 1);
}

/**
 * @test Dispose_Clears_And_Rejects_Further_Events
 * @brief After dispose() bindings are empty and every dispatch reports Disposed.
 */
TEST_F(RegistryFixture, Dispose_Clears_And_Rejects_Further_Events) {
  ASSERT_TRUE(reg.onNodeDiscovered("gw-a.example.com", kSipGw, std::nullopt));
  ASSERT_TRUE(reg.onNodeDiscovered(kServer, CapabilitySet{}, VersionInfo{"Prosody", "0.12", ""}));

  ASSERT_TRUE(reg.dispose());
  EXPECT_EQ(pool->disposes, 1);
  EXPECT_FALSE(reg.getSipGateway().has_value());
  EXPECT_FALSE(reg.getServerVersion().has_value());

  auto d = reg.onNodeDiscovered("gw-b.example.com", kSipGw, std::nullopt);
  auto l = reg.onNodeLost("gw-a.example.com");
  auto h = reg.onHealthCheckFailed("jvb1.example.com");
  ASSERT_FALSE(d); ASSERT_FALSE(l); ASSERT_FALSE(h);
  EXPECT_EQ(d.error(), MembershipErr::Disposed);
  EXPECT_EQ(l.error(), MembershipErr::Disposed);
  EXPECT_EQ(h.error(), MembershipErr::Disposed);
  EXPECT_TRUE(pool->removed.empty());

  auto again = reg.dispose();
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error(), MembershipErr::Disposed);
  EXPECT_EQ(pool->disposes, 1);
}

TEST_F(RegistryFixture, Empty_Address_Is_Rejected) {
  auto r = reg.onNodeDiscovered(NodeAddress{}, kSipGw, std::nullopt);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), MembershipErr::InvalidAddress);
  EXPECT_FALSE(reg.getSipGateway().has_value());
}

// --------------------------- Configuration errors --------------------------

TEST(MembershipRegistry, Init_Without_BridgePool_Fails) {
  MembershipRegistry reg{MembershipDeps{}};
  auto r = reg.init(MembershipConfig{});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), MembershipErr::MissingBridgePool);
  EXPECT_EQ(reg.state(), MembershipRegistry::State::Created);
}

TEST(MembershipRegistry, Init_Brewery_Without_Factory_Fails) {
  auto pool = std::make_shared<RecordingBridgePool>();
  MembershipRegistry reg{MembershipDeps{pool, nullptr, nullptr}};
  MembershipConfig cfg;
  cfg.jigasi_brewery = "jigasibrewery@internal.auth.example.com";

  auto r = reg.init(cfg);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), MembershipErr::MissingDetectorFactory);
  EXPECT_EQ(pool->inits, 0);
}

// --------------------------- Detectors -------------------------------------

/**
 * @test Detectors_Built_Only_For_Configured_Breweries
 * @brief Absent brewery names leave the detector slot empty; dispose releases
 *        the others in reverse creation order.
 */
TEST(MembershipRegistry, Detectors_Built_Only_For_Configured_Breweries) {
  auto pool = std::make_shared<RecordingBridgePool>();
  auto factory = std::make_shared<FakeDetectorFactory>();
  MembershipRegistry reg{MembershipDeps{pool, factory, nullptr}};

  MembershipConfig cfg;
  cfg.jibri_brewery = "jibribrewery@internal.auth.example.com";
  cfg.jibri_sip_brewery = "jibrisipbrewery@internal.auth.example.com";
  ASSERT_TRUE(reg.init(cfg));

  ASSERT_NE(reg.detector(DetectorKind::Recorder), nullptr);
  EXPECT_EQ(reg.detector(DetectorKind::Recorder)->brewery(), cfg.jibri_brewery);
  EXPECT_EQ(reg.detector(DetectorKind::SipGatewayPool), nullptr);
  ASSERT_NE(reg.detector(DetectorKind::SipRecorder), nullptr);
  EXPECT_EQ(reg.detector(DetectorKind::SipRecorder)->kind(), DetectorKind::SipRecorder);

  ASSERT_TRUE(reg.dispose());
  EXPECT_EQ(reg.detector(DetectorKind::Recorder), nullptr);

  const std::vector<std::string> expected{
    "init recorder", "init sip_recorder", "dispose sip_recorder", "dispose recorder"};
  EXPECT_EQ(factory->journal.lines, expected);
}

TEST(MembershipRegistry, Init_Refused_Detector_Rolls_Back) {
  auto pool = std::make_shared<RecordingBridgePool>();
  auto factory = std::make_shared<FakeDetectorFactory>();
  factory->refuse = DetectorKind::SipGatewayPool;
  MembershipRegistry reg{MembershipDeps{pool, factory, nullptr}};

  MembershipConfig cfg;
  cfg.jibri_brewery = "jibribrewery@internal.auth.example.com";
  cfg.jigasi_brewery = "jigasibrewery@internal.auth.example.com";
  auto r = reg.init(cfg);

  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), MembershipErr::DetectorUnavailable);
  EXPECT_EQ(pool->disposes, 1);
  const std::vector<std::string> expected{"init recorder", "dispose recorder"};
  EXPECT_EQ(factory->journal.lines, expected);
  EXPECT_EQ(reg.state(), MembershipRegistry::State::Created);
}

TEST(MembershipRegistry, Init_Detector_Exception_Propagates_After_Rollback) {
  auto pool = std::make_shared<RecordingBridgePool>();
  auto factory = std::make_shared<FakeDetectorFactory>();
  factory->fail_init = DetectorKind::SipRecorder;
  MembershipRegistry reg{MembershipDeps{pool, factory, nullptr}};

  MembershipConfig cfg;
  cfg.jibri_brewery = "jibribrewery@internal.auth.example.com";
  cfg.jibri_sip_brewery = "jibrisipbrewery@internal.auth.example.com";

  EXPECT_THROW((void)reg.init(cfg), std::runtime_error);
  EXPECT_EQ(pool->disposes, 1);
  const std::vector<std::string> expected{"init recorder", "dispose recorder"};
  EXPECT_EQ(factory->journal.lines, expected);
  EXPECT_EQ(reg.state(), MembershipRegistry::State::Created);
}

// --------------------------- Collaborator failures -------------------------

/**
 * @test Dispose_Finishes_Teardown_When_Detector_Throws
 * @brief A detector failing to release still lets the other detector and the
 *        pool be released and the bindings be cleared; the failure is rethrown.
 */
TEST(MembershipRegistry, Dispose_Finishes_Teardown_When_Detector_Throws) {
  auto pool = std::make_shared<RecordingBridgePool>();
  auto factory = std::make_shared<FakeDetectorFactory>();
  factory->fail_dispose = DetectorKind::SipRecorder;
  MembershipRegistry reg{MembershipDeps{pool, factory, nullptr}};

  MembershipConfig cfg;
  cfg.server_identity = kServer;
  cfg.jibri_brewery = "jibribrewery@internal.auth.example.com";
  cfg.jibri_sip_brewery = "jibrisipbrewery@internal.auth.example.com";
  ASSERT_TRUE(reg.init(cfg));
  ASSERT_TRUE(reg.onNodeDiscovered("gw.example.com", kSipGw, std::nullopt));
  ASSERT_TRUE(reg.onNodeDiscovered("jvb.example.com", kBridge, std::nullopt));

  EXPECT_THROW((void)reg.dispose(), std::runtime_error);

  EXPECT_EQ(reg.state(), MembershipRegistry::State::Disposed);
  EXPECT_EQ(pool->disposes, 1);
  EXPECT_TRUE(pool->members.empty());
  EXPECT_FALSE(reg.getSipGateway().has_value());
  const std::vector<std::string> expected{
    "init recorder", "init sip_recorder", "dispose sip_recorder", "dispose recorder"};
  EXPECT_EQ(factory->journal.lines, expected);

  auto again = reg.dispose();
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error(), MembershipErr::Disposed);
  EXPECT_EQ(pool->disposes, 1);
}

/**
 * @test Full_Bridge_Pool_Surfaces_To_Caller
 * @brief A bridge the pool cannot take is reported by the discovery call and
 *        is not announced as forwarded.
 */
TEST(MembershipRegistry, Full_Bridge_Pool_Surfaces_To_Caller) {
  auto bridges = std::make_shared<BridgeRegistry>();
  RecordingObserver observer;
  MembershipRegistry reg{MembershipDeps{bridges, nullptr, &observer}};
  ASSERT_TRUE(reg.init(MembershipConfig{}));

  constexpr std::size_t kMax = BridgeRegistry::Limits::MaxBridges;
  for (std::size_t i = 0; i < kMax; ++i) {
    ASSERT_TRUE(reg.onNodeDiscovered("jvb" + std::to_string(i) + ".example.com",
                                     kBridge, std::nullopt));
  }

  EXPECT_THROW((void)reg.onNodeDiscovered("jvb-extra.example.com", kBridge, std::nullopt),
               std::length_error);
  EXPECT_FALSE(bridges->contains("jvb-extra.example.com"));
  EXPECT_EQ(observer.snapshot().bridge_forwards, kMax);

  // The registry itself is unaffected.
  ASSERT_TRUE(reg.onNodeDiscovered("gw.example.com", kSipGw, std::nullopt));
  EXPECT_EQ(reg.getSipGateway(), NodeAddress("gw.example.com"));
}

/**
 * @test Pool_Exception_Propagates_And_Registry_Stays_Usable
 * @brief A throwing pool surfaces to the caller; the registry lock is not held.
 */
TEST_F(RegistryFixture, Pool_Exception_Propagates_And_Registry_Stays_Usable) {
  pool->throw_on_add = true;
  EXPECT_THROW((void)reg.onNodeDiscovered("jvb1.example.com", kBridge, std::nullopt),
               std::runtime_error);

  pool->throw_on_add = false;
  ASSERT_TRUE(reg.onNodeDiscovered("gw-a.example.com", kSipGw, std::nullopt));
  EXPECT_EQ(reg.getSipGateway(), NodeAddress("gw-a.example.com"));
}

TEST_F(RegistryFixture, Pool_Callback_Can_Read_Registry) {
  std::optional<NodeAddress> seen;
  ASSERT_TRUE(reg.onNodeDiscovered("gw-a.example.com", kSipGw, std::nullopt));
  pool->on_add = [&] { seen = reg.getSipGateway(); };

  ASSERT_TRUE(reg.onNodeDiscovered("jvb1.example.com", kBridge, std::nullopt));
  EXPECT_EQ(seen, NodeAddress("gw-a.example.com"));
}

// --------------------------- Concurrency sanity ----------------------------

/**
 * @test Readers_See_Whole_Generations
 * @brief One writer binds and unbinds the gateway in a loop; readers
 *        only ever see snapshots whose generation matches their content.
 *
 * Lightweight sanity test, not a linearizability proof.
 */
TEST_F(RegistryFixture, Readers_See_Whole_Generations) {
  std::atomic<bool> stop{false};
  std::atomic<std::size_t> bad{0};

  auto reader = [&] {
    std::uint64_t last = 0;
    while (!stop.load(std::memory_order_relaxed)) {
      auto snap = reg.bindings();
      if (snap->generation < last) bad.fetch_add(1);
      last = snap->generation;
      // The writer binds the gateway at odd generations and clears it at even ones.
      const bool expect_bound = (snap->generation % 2) == 1;
      if (snap->sip_gateway.has_value() != expect_bound) bad.fetch_add(1);
      if (snap->sip_gateway && snap->sip_gateway->value != "gw.example.com") bad.fetch_add(1);
    }
  };

  std::vector<std::thread> readers;
  for (int i = 0; i < 3; ++i) readers.emplace_back(reader);

  for (int i = 0; i < 2000; ++i) {
    EXPECT_TRUE(reg.onNodeDiscovered("gw.example.com", kSipGw, std::nullopt));
    EXPECT_TRUE(reg.onNodeLost("gw.example.com"));
  }
  stop.store(true);
  for (auto& t : readers) t.join();

  EXPECT_EQ(bad.load(), 0u);
  EXPECT_EQ(reg.bindings()->generation, 4000u);
}
