/**
 * @file main.cpp
 * @brief roster_app: wires config → BridgeRegistry → MembershipRegistry and
 *        replays a scripted discovery sequence through an EventPump.
 *
 * **Bootstrap**
 * - Load the JSON config (argv[1], or named defaults).
 * - Construct the bridge pool, the detector factory and the registry; init().
 *
 * **Dispatch**
 * - A transport thread submits events; this thread drains them into the registry.
 *
 * **Shutdown**
 * - Print the resulting bindings and counters, dispose().
 */

#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "roster/config/config_loader.hpp"
#include "roster/membership/bridge_registry.hpp"
#include "roster/membership/capability_matcher.hpp"
#include "roster/membership/event_pump.hpp"
#include "roster/membership/membership_registry.hpp"
#include "roster/obs/observability.hpp"
#include "roster/version.hpp"

namespace {

using namespace roster::membership;

// Brewery watching is owned by the worker-pool services; this binary only
// shows the lifecycle the registry drives.
class LogOnlyDetector final : public Detector {
public:
    LogOnlyDetector(DetectorKind kind, std::string brewery)
        : kind_(kind), brewery_(std::move(brewery)) {}
    void init() override {
        std::cout << "detector " << to_string(kind_) << " watching " << brewery_ << "\n";
    }
    void dispose() override {
        std::cout << "detector " << to_string(kind_) << " released\n";
    }
    DetectorKind kind() const noexcept override { return kind_; }
    const std::string& brewery() const noexcept override { return brewery_; }
private:
    DetectorKind kind_;
    std::string brewery_;
};

class LogOnlyDetectorFactory final : public DetectorFactory {
public:
    std::unique_ptr<Detector> create(DetectorKind kind, const std::string& brewery) override {
        return std::make_unique<LogOnlyDetector>(kind, brewery);
    }
};

CapabilitySet features_of(Role role) {
    CapabilitySet caps;
    for (auto f : required_features(role)) caps.emplace(f);
    return caps;
}

std::vector<MembershipEvent> demo_script(const std::string& server) {
    CapabilitySet bridge = features_of(Role::BridgeNode);
    CapabilitySet sipgw  = features_of(Role::SipGateway);
    CapabilitySet muc    = features_of(Role::RoomService);
    return {
        MembershipEvent::discovered("jvb1.meet.example", bridge, VersionInfo{"JVB", "2.1", "linux"}),
        MembershipEvent::discovered("jvb2.meet.example", bridge, VersionInfo{"JVB", "2.1", "linux"}),
        MembershipEvent::discovered("conference.meet.example", muc),
        MembershipEvent::discovered("jigasi.meet.example", sipgw),
        MembershipEvent::discovered("jigasi-b.meet.example", sipgw),
        MembershipEvent::discovered(server, {"jabber:iq:version"}, VersionInfo{"Prosody", "0.12", "linux"}),
        MembershipEvent::discovered("pubsub.meet.example", {"http://jabber.org/protocol/pubsub"}),
        MembershipEvent::health_check_failed("jvb2.meet.example"),
        MembershipEvent::lost("jigasi.meet.example"),
        MembershipEvent::discovered("jigasi-b.meet.example", sipgw),
    };
}

} // namespace

int main(int argc, char** argv) {
    const std::string path = (argc > 1) ? argv[1] : "";
    auto cfg = roster::config::Loader::load_from_file(path);
    if (!cfg) {
        const auto& e = cfg.error();
        std::cerr << "config error";
        if (!e.key.empty()) std::cerr << " at " << e.key;
        std::cerr << ": " << e.message << "\n";
        return 2;
    }
    if (cfg->membership.server_identity.empty()) {
        cfg->membership.server_identity = "meet.example";
    }

    std::cout << "roster " << roster::version_string << "\n";

    auto bridges = std::make_shared<BridgeRegistry>();
    MembershipRegistry registry(MembershipDeps{
        bridges, std::make_shared<LogOnlyDetectorFactory>(), roster::obs::make_simple_observer()});

    if (auto r = registry.init(cfg->membership); !r) {
        std::cerr << "init failed: " << to_string(r.error()) << "\n";
        return 1;
    }

    auto pump = EventPump::with_capacity(cfg->dispatch.queue_capacity);
    if (!pump) {
        std::cerr << "cannot build event pump\n";
        return 1;
    }

    const auto script = demo_script(cfg->membership.server_identity);
    std::atomic<bool> stop{false};
    std::thread transport([&] {
        for (const auto& ev : script) {
            while (!pump->submit(ev)) {
                if (stop.load(std::memory_order_acquire)) return;
                std::this_thread::yield();
            }
        }
    });

    std::size_t handled = 0;
    while (handled < script.size()) {
        auto n = pump->drain(registry);
        if (!n) {
            std::cerr << "dispatch failed: " << to_string(n.error()) << "\n";
            stop.store(true, std::memory_order_release);
            break;
        }
        if (*n == 0) std::this_thread::yield();
        handled += *n;
    }
    transport.join();

    const auto b = registry.bindings();
    std::cout << "sip gateway:    " << (b->sip_gateway ? b->sip_gateway->value : "<unset>") << "\n"
              << "room service:   " << (b->room_service ? b->room_service->value : "<unset>") << "\n"
              << "server version: " << (b->server_version ? to_string(*b->server_version) : "<unset>") << "\n"
              << "bridges:        " << bridges->size() << "\n";

    const auto c = roster::obs::make_simple_observer()->snapshot();
    std::cout << "conflicts ignored: " << c.conflicts_ignored
              << ", unrecognized: " << c.unrecognized << "\n";

    if (auto r = registry.dispose(); !r) {
        std::cerr << "dispose failed: " << to_string(r.error()) << "\n";
        return 1;
    }
    return 0;
}
