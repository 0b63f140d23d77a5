#pragma once
/**
 * @file capability_matcher.hpp
 * @brief Capability-set classification: ordered (role, required features) rules.
 * @details Pure and stateless. Precedence is the order of the rule table, not
 *          a score: the first rule whose required features are all present wins.
 */

#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "roster/membership/node.hpp"

namespace roster::membership {

/** @struct RoleRule
 *  @brief One row of the classification table.
 */
struct RoleRule {
    Role role;                                  ///< Role granted on match
    std::span<const std::string_view> required; ///< Features that must all be advertised
};

/// Classification table in precedence order (BridgeNode, SipGateway, RoomService).
std::span<const RoleRule> role_rules() noexcept;

/**
 * @brief Required-feature list for a role.
 * @return Empty span for ServerIdentity (matched by address, not features).
 */
std::span<const std::string_view> required_features(Role role) noexcept;

/// True if @p caps contains every entry of @p required (exact string match).
[[nodiscard]] bool supports(const CapabilitySet& caps,
                            std::span<const std::string_view> required) noexcept;

/**
 * @brief Classify a capability set.
 * @return First matching role in precedence order; std::nullopt if none.
 *         Never returns Role::ServerIdentity.
 */
[[nodiscard]] std::optional<Role> classify(const CapabilitySet& caps) noexcept;

/**
 * @brief All roles whose requirements @p caps satisfies, in precedence order.
 * @details The registry walks this list so a singleton role that is already
 *          bound can pass the node on to the next candidate role.
 */
[[nodiscard]] std::vector<Role> matching_roles(const CapabilitySet& caps);

} // namespace roster::membership
