/**
 * @file node.hpp
 * @brief Common cluster-node model shared across membership components.
 *
 * Defines the role tag, the node address, the advertised capability set and
 * the version metadata used by the capability matcher, the membership
 * registry and the bridge pool. Centralizing these types keeps hashing and
 * comparisons consistent across modules.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace roster::membership {

/**
 * @brief Cluster role a discovered node can be classified into.
 *
 * @note Semantics:
 *  - BridgeNode:     media bridge; multi-valued, owned by the bridge pool.
 *  - SipGateway:     SIP gateway component; singleton.
 *  - RoomService:    multi-user room (MUC) component; singleton.
 *  - ServerIdentity: the signalling server itself; matched by address only.
 */
enum class Role : std::uint8_t {
  BridgeNode = 0,
  SipGateway = 1,
  RoomService = 2,
  ServerIdentity = 3
};

/// Stable lower-case label for logs and JSON lines.
const char* to_string(Role r) noexcept;

/**
 * @brief Opaque address of a cluster node (discovery-protocol address).
 *
 * Only equality and hashing are meaningful. An empty value is never a valid
 * node and is rejected by the registry.
 */
struct NodeAddress final {
  std::string value;

  NodeAddress() = default;
  NodeAddress(std::string v) : value(std::move(v)) {}
  NodeAddress(const char* v) : value(v) {}

  [[nodiscard]] bool empty() const noexcept { return value.empty(); }

  bool operator==(const NodeAddress&) const = default;
};

/// Hash functor so NodeAddress can key unordered containers.
struct NodeAddressHash {
  std::size_t operator()(const NodeAddress& a) const noexcept {
    return std::hash<std::string>{}(a.value);
  }
};

/**
 * @brief Version metadata a node reports alongside its features
 *        (XEP-0092 software version: name, version, os).
 */
struct VersionInfo final {
  std::string name;
  std::string version;
  std::string os;

  bool operator==(const VersionInfo&) const = default;
};

/// "name/version (os)" with missing parts omitted.
std::string to_string(const VersionInfo& v);

// Transparent hash/equal functors enable lookups with string_view feature
// names (the required-feature tables are string_view constants).
struct FeatureHash {
  using is_transparent = void;
  std::size_t operator()(std::string_view s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }
};
struct FeatureEq {
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept {
    return a == b;
  }
};

/**
 * @brief Unordered set of feature identifiers advertised by a node.
 */
using CapabilitySet = std::unordered_set<std::string, FeatureHash, FeatureEq>;

} // namespace roster::membership
