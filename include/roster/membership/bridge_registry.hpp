#pragma once
// roster: BridgeRegistry
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Readers take a snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • Writers copy the map under a mutex, mutate, and swap with RELEASE semantics.
//   • Readers never block writers; writers never block readers.
//   • Old snapshots are reclaimed by shared_ptr refcounts.


#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "roster/membership/bridge_pool.hpp"

namespace roster::membership {

/// One live bridge as seen by the pool.
struct BridgeRecord final {
    NodeAddress                address;  ///< Bridge address
    std::optional<VersionInfo> version;  ///< Reported version, if any

    bool operator==(const BridgeRecord&) const = default;
};

///
/// In-memory BridgePool: NodeAddress → BridgeRecord.
/// - add() is an upsert; re-discovery refreshes the stored version.
/// - remove() of an unknown address is a no-op.
/// - Bounded: a new address beyond Limits::MaxBridges throws std::length_error
///   (refreshing a known address still succeeds). An empty address throws
///   std::invalid_argument. Both are counted as failures and leave the map as is.
///
/// Thread-safety:
///   - Reads are lock-free.
///   - Writes are serialized by an internal mutex.
//
class BridgeRegistry final : public BridgePool {
public:
    /// Compile-time capacity limits.
    struct Limits {
        static constexpr std::size_t MaxBridges = 4096; ///< Max number of live bridges.
    };

    using Map = std::unordered_map<NodeAddress, BridgeRecord, NodeAddressHash>;

    // --------------------------- BridgePool ----------------------------------
    void init() override;
    void dispose() override;
    void add(const NodeAddress& address, const std::optional<VersionInfo>& version) override;
    void remove(const NodeAddress& address) override;
    [[nodiscard]] bool contains(const NodeAddress& address) const override;
    [[nodiscard]] std::optional<VersionInfo> lookupVersion(const NodeAddress& address) const override;

    // --------------------------- RCU Snapshot API ----------------------------
    /// Consistent snapshot of the whole bridge map.
    std::shared_ptr<const Map> snapshot() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<BridgeRecord> listBridges() const;
    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    /// Monotonic version counter. Increments on every published mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Observability -------------------------------
    struct Stats {
        uint64_t adds{0}, refreshes{0}, removes{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    void publish(std::shared_ptr<Map> next) noexcept;

    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<uint64_t> version_{0};
    std::atomic<bool> running_{false};
    std::mutex write_mu_;

    std::atomic<uint64_t> adds_{0}, refreshes_{0}, removes_{0}, failures_{0};
};

} // namespace roster::membership
