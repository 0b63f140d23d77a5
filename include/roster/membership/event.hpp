#pragma once
/**
 * @file event.hpp
 * @brief Discovery/loss/health events as delivered by the transport.
 */

#include <cstdint>
#include <optional>
#include <utility>

#include "roster/membership/node.hpp"

namespace roster::membership {

enum class EventKind : std::uint8_t {
    Discovered = 0,
    Lost = 1,
    HealthCheckFailed = 2
};

/// One transport event. capabilities/version are only meaningful for Discovered.
struct MembershipEvent final {
    EventKind                  kind{EventKind::Discovered};
    NodeAddress                address;
    CapabilitySet              capabilities;
    std::optional<VersionInfo> version;

    static MembershipEvent discovered(NodeAddress a, CapabilitySet caps,
                                      std::optional<VersionInfo> v = std::nullopt) {
        return MembershipEvent{EventKind::Discovered, std::move(a), std::move(caps), std::move(v)};
    }
    static MembershipEvent lost(NodeAddress a) {
        return MembershipEvent{EventKind::Lost, std::move(a), {}, std::nullopt};
    }
    static MembershipEvent health_check_failed(NodeAddress a) {
        return MembershipEvent{EventKind::HealthCheckFailed, std::move(a), {}, std::nullopt};
    }
};

} // namespace roster::membership
