#pragma once
// roster: MembershipRegistry
// Concurrency Model: single writer, many readers.
//   • Event dispatch (discovered / lost / health failed) runs in one dispatch
//     context; mutations are additionally serialized by write_mu_.
//   • Singleton bindings live in one immutable Bindings snapshot that writers
//     replace wholesale (copy, modify, atomic swap with RELEASE). Readers
//     atomically load it (ACQUIRE) and never block or see a torn binding.
//   • write_mu_ is never held across a call into the bridge pool or a detector.


#include <array>
#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "roster/compat/expected.hpp"
#include "roster/config/config_loader.hpp"
#include "roster/membership/bridge_pool.hpp"
#include "roster/membership/detector.hpp"
#include "roster/membership/node.hpp"
#include "roster/obs/observability.hpp"

namespace roster::membership {

// -----------------------------------------------------------------------------
// Error codes returned by registry operations. Protocol noise is not an error.
// -----------------------------------------------------------------------------
/// Result codes for lifecycle and dispatch calls.
enum class MembershipErr {
    MissingBridgePool,      ///< init(): no bridge pool was supplied.
    MissingDetectorFactory, ///< init(): a brewery is configured but no factory was supplied.
    DetectorUnavailable,    ///< init(): the factory returned no detector for a configured brewery.
    AlreadyInitialized,     ///< init() called twice.
    NotInitialized,         ///< Event dispatched before init().
    Disposed,               ///< Event dispatched (or dispose() repeated) after dispose().
    InvalidAddress          ///< Empty node address.
};

const char* to_string(MembershipErr e) noexcept;

using Result = roster_detail::expected<void, MembershipErr>;

/// Immutable view of the singleton role bindings.
struct Bindings final {
    std::optional<NodeAddress> sip_gateway;    ///< Bound SIP gateway, if any
    std::optional<NodeAddress> room_service;   ///< Bound room (MUC) service, if any
    std::optional<VersionInfo> server_version; ///< Last version seen from the server identity
    uint64_t                   generation{0};  ///< Bumped on every published change

    bool operator==(const Bindings&) const = default;
};

/// Collaborators handed to the registry at construction.
struct MembershipDeps {
    std::shared_ptr<BridgePool>      bridge_pool;         ///< Required; checked by init()
    std::shared_ptr<DetectorFactory> detector_factory;    ///< Required only if a brewery is configured
    roster::obs::Observer*           observer{nullptr};   ///< Optional change sink (not owned)
};

///
/// Classifies discovered nodes into cluster roles and keeps the live view of
/// which address holds which singleton role.
/// - Bridges are forwarded to the bridge pool; nothing is stored locally.
/// - SIP gateway and room service are first-wins until the holder is lost.
/// - The server identity's version is overwritten on every sighting.
///
/// Lifecycle: Created → init() → Running → dispose() → Disposed.
/// Dispatching outside Running is reported, never silently dropped.
//
class MembershipRegistry final {
public:
    enum class State : uint8_t { Created, Running, Disposed };

    explicit MembershipRegistry(MembershipDeps deps);
    ~MembershipRegistry();

    MembershipRegistry(const MembershipRegistry&) = delete;
    MembershipRegistry& operator=(const MembershipRegistry&) = delete;

    // --------------------------- Lifecycle -----------------------------------
    /**
     * @brief Start the bridge pool and the configured detectors.
     * @details If a collaborator throws, collaborators already started are
     *          released and the exception is rethrown; the registry stays Created.
     */
    Result init(const roster::config::MembershipConfig& cfg);

    /**
     * @brief Release detectors (reverse creation order) and the bridge pool; clear bindings.
     * @details Every collaborator is released and the bindings are cleared even
     *          if one of them throws; the first exception is then rethrown. The
     *          registry is Disposed either way.
     */
    Result dispose();

    [[nodiscard]] State state() const noexcept { return state_.load(std::memory_order_acquire); }

    // --------------------------- Event dispatch ------------------------------
    /**
     * @brief A node became reachable.
     * @param address Node address.
     * @param caps Features the node advertises.
     * @param version Version metadata, if the node reported one.
     */
    Result onNodeDiscovered(const NodeAddress& address,
                            const CapabilitySet& caps,
                            const std::optional<VersionInfo>& version);

    /// A node went away. Unknown addresses are a no-op.
    Result onNodeLost(const NodeAddress& address);

    /// A bridge failed its health check; always forwarded to the pool.
    Result onHealthCheckFailed(const NodeAddress& address);

    // --------------------------- Reads (any thread) --------------------------
    [[nodiscard]] std::optional<NodeAddress> getSipGateway() const noexcept;
    [[nodiscard]] std::optional<NodeAddress> getRoomService() const noexcept;
    [[nodiscard]] std::optional<VersionInfo> getServerVersion() const noexcept;

    /// Whole binding snapshot; all fields observed at one generation.
    [[nodiscard]] std::shared_ptr<const Bindings> bindings() const noexcept;

    /// Version the bridge pool holds for @p address (empty if unknown or no pool).
    [[nodiscard]] std::optional<VersionInfo> getBridgeVersion(const NodeAddress& address) const;

    /// The bridge pool supplied at construction (may be null).
    [[nodiscard]] BridgePool* bridgePool() const noexcept { return deps_.bridge_pool.get(); }

    /// Detector of @p kind, or nullptr when its brewery is not configured
    /// or the registry is not Running. Call from the dispatch context.
    [[nodiscard]] Detector* detector(DetectorKind kind) const noexcept;

    /// Configured server identity (empty before init()).
    [[nodiscard]] const NodeAddress& serverIdentity() const noexcept { return server_identity_; }

private:
    // Outcome of offering a node to one singleton role.
    enum class Claim : uint8_t { Bound, AlreadyHeld, HeldElsewhere };

    Result check_dispatch(const NodeAddress& address) const noexcept;
    Claim  claim_singleton(Role role, const NodeAddress& address);
    bool   release_singleton(Role role, const NodeAddress& address);
    void   record_server_version(const NodeAddress& address, const std::optional<VersionInfo>& version);
    // Disposes every detector, then the pool; returns the first exception raised.
    std::exception_ptr release_collaborators() noexcept;
    void   emit(roster::obs::ChangeKind kind, std::optional<Role> role,
                const NodeAddress& address, std::string detail = {}) const;

    // Called with write_mu_ held.
    void publish(std::shared_ptr<Bindings> next) noexcept;

    MembershipDeps deps_;
    NodeAddress    server_identity_;
    std::array<std::unique_ptr<Detector>, kDetectorKinds> detectors_{};

    std::shared_ptr<const Bindings> bindings_{std::make_shared<Bindings>()};
    std::mutex          write_mu_;
    std::atomic<State>  state_{State::Created};
};

} // namespace roster::membership
