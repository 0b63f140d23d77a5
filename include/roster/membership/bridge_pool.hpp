#pragma once
/**
 * @file bridge_pool.hpp
 * @brief Interface of the multi-valued bridge role owner.
 * @details The membership registry forwards bridge discoveries, losses and
 *          health failures here verbatim. Implementations own idempotence and
 *          their own synchronization; exceptions thrown from these calls reach
 *          the caller of the registry operation that triggered them.
 */

#include <optional>

#include "roster/membership/node.hpp"

namespace roster::membership {

/** @class BridgePool
 *  @brief Owner of the set of live media bridges.
 */
class BridgePool {
public:
    virtual ~BridgePool() = default;

    /// Start the pool. Called once from MembershipRegistry::init().
    virtual void init() = 0;
    /// Release the pool. Called once from MembershipRegistry::dispose().
    virtual void dispose() = 0;

    /// Add (or refresh) a bridge. Repeated adds of one address are allowed.
    virtual void add(const NodeAddress& address, const std::optional<VersionInfo>& version) = 0;
    /// Remove a bridge; unknown addresses are ignored.
    virtual void remove(const NodeAddress& address) = 0;

    [[nodiscard]] virtual bool contains(const NodeAddress& address) const = 0;
    [[nodiscard]] virtual std::optional<VersionInfo> lookupVersion(const NodeAddress& address) const = 0;
};

} // namespace roster::membership
