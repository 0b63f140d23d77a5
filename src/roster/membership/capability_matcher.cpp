/**
 * @file capability_matcher.cpp
 * @brief Rule table and subset checks for capability classification.
 */
#include "roster/membership/capability_matcher.hpp"
#include "roster/config/constants.hpp"

#include <algorithm>
#include <array>

namespace roster::membership {
    using namespace roster::config::constants;

    namespace {
        constexpr std::array<std::string_view, 4> kBridgeFeatures{
            FEATURE_COLIBRI, FEATURE_DTLS_SRTP, FEATURE_ICE_UDP, FEATURE_RAW_UDP};
        constexpr std::array<std::string_view, 2> kSipGatewayFeatures{
            FEATURE_JIGASI, FEATURE_RAYO};
        constexpr std::array<std::string_view, 1> kRoomServiceFeatures{
            FEATURE_MUC};

        // Order is precedence.
        constexpr std::array<RoleRule, 3> kRules{{
            {Role::BridgeNode,  kBridgeFeatures},
            {Role::SipGateway,  kSipGatewayFeatures},
            {Role::RoomService, kRoomServiceFeatures},
        }};
    }

    std::span<const RoleRule> role_rules() noexcept {
        return kRules;
    }

    std::span<const std::string_view> required_features(Role role) noexcept {
        for (const auto& r : kRules) if (r.role == role) return r.required;
        return {};
    }

    bool supports(const CapabilitySet& caps,
                  std::span<const std::string_view> required) noexcept {
        return std::all_of(required.begin(), required.end(),
                           [&](std::string_view f) { return caps.find(f) != caps.end(); });
    }

    std::optional<Role> classify(const CapabilitySet& caps) noexcept {
        for (const auto& r : kRules) {
            if (supports(caps, r.required)) return r.role;
        }
        return std::nullopt;
    }

    std::vector<Role> matching_roles(const CapabilitySet& caps) {
        std::vector<Role> out;
        for (const auto& r : kRules) {
            if (supports(caps, r.required)) out.push_back(r.role);
        }
        return out;
    }

} // namespace roster::membership
