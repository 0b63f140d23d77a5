// MembershipRegistry: implementation notes
// Singleton bindings follow the same RCU scheme as BridgeRegistry: a writer
// copies the current Bindings, edits the copy, and publishes it with a
// RELEASE store; a reader's ACQUIRE load yields one consistent generation.
// Bridge pool and detector calls happen outside write_mu_ so a collaborator
// that calls back into the read accessors cannot deadlock against us.

#include "roster/membership/membership_registry.hpp"

#include <exception>
#include <utility>

#include "roster/membership/capability_matcher.hpp"

namespace roster::membership {

using roster::obs::ChangeKind;

const char* to_string(MembershipErr e) noexcept {
    switch (e) {
        case MembershipErr::MissingBridgePool:      return "missing_bridge_pool";
        case MembershipErr::MissingDetectorFactory: return "missing_detector_factory";
        case MembershipErr::DetectorUnavailable:    return "detector_unavailable";
        case MembershipErr::AlreadyInitialized:     return "already_initialized";
        case MembershipErr::NotInitialized:         return "not_initialized";
        case MembershipErr::Disposed:               return "disposed";
        case MembershipErr::InvalidAddress:         return "invalid_address";
    }
    return "unknown";
}

MembershipRegistry::MembershipRegistry(MembershipDeps deps)
    : deps_(std::move(deps)) {}

// The embedder owns the lifecycle; a registry destroyed while Running only
// drops its detector handles. It does not call dispose() on their behalf.
MembershipRegistry::~MembershipRegistry() = default;

//------------------------------- Lifecycle ------------------------------------

Result MembershipRegistry::init(const roster::config::MembershipConfig& cfg) {
    const auto st = state();
    if (st == State::Running)  return roster_detail::unexpected(MembershipErr::AlreadyInitialized);
    if (st == State::Disposed) return roster_detail::unexpected(MembershipErr::Disposed);
    if (!deps_.bridge_pool)    return roster_detail::unexpected(MembershipErr::MissingBridgePool);

    const std::array<const std::string*, kDetectorKinds> breweries{
        &cfg.jibri_brewery, &cfg.jigasi_brewery, &cfg.jibri_sip_brewery};

    bool wants_detectors = false;
    for (const auto* b : breweries) wants_detectors = wants_detectors || !b->empty();
    if (wants_detectors && !deps_.detector_factory) {
        return roster_detail::unexpected(MembershipErr::MissingDetectorFactory);
    }

    deps_.bridge_pool->init();
    std::exception_ptr failure;
    bool refused = false;
    try {
        for (std::size_t i = 0; i < kDetectorKinds; ++i) {
            if (breweries[i]->empty()) continue;
            auto det = deps_.detector_factory->create(static_cast<DetectorKind>(i), *breweries[i]);
            if (!det) { refused = true; break; }
            det->init();
            detectors_[i] = std::move(det);
        }
    } catch (...) {
        failure = std::current_exception();
    }

    if (failure || refused) {
        // The original failure wins over one raised while rolling back.
        auto rollback = release_collaborators();
        if (failure)  std::rethrow_exception(failure);
        if (rollback) std::rethrow_exception(rollback);
        return roster_detail::unexpected(MembershipErr::DetectorUnavailable);
    }

    server_identity_ = NodeAddress{cfg.server_identity};
    state_.store(State::Running, std::memory_order_release);
    return {};
}

Result MembershipRegistry::dispose() {
    if (state() == State::Disposed) return roster_detail::unexpected(MembershipErr::Disposed);
    const bool was_running = state() == State::Running;
    state_.store(State::Disposed, std::memory_order_release);

    std::exception_ptr failure;
    if (was_running) failure = release_collaborators();

    {
        std::lock_guard<std::mutex> lk(write_mu_);
        auto next = std::make_shared<Bindings>();
        next->generation = bindings()->generation + 1;
        publish(std::move(next));
    }

    if (failure) std::rethrow_exception(failure);
    return {};
}

std::exception_ptr MembershipRegistry::release_collaborators() noexcept {
    std::exception_ptr first;
    for (auto it = detectors_.rbegin(); it != detectors_.rend(); ++it) {
        if (!*it) continue;
        auto det = std::move(*it);
        try {
            det->dispose();
        } catch (...) {
            if (!first) first = std::current_exception();
        }
    }
    try {
        deps_.bridge_pool->dispose();
    } catch (...) {
        if (!first) first = std::current_exception();
    }
    return first;
}

//------------------------------- Dispatch -------------------------------------

Result MembershipRegistry::check_dispatch(const NodeAddress& address) const noexcept {
    switch (state()) {
        case State::Created:  return roster_detail::unexpected(MembershipErr::NotInitialized);
        case State::Disposed: return roster_detail::unexpected(MembershipErr::Disposed);
        case State::Running:  break;
    }
    if (address.empty()) return roster_detail::unexpected(MembershipErr::InvalidAddress);
    return {};
}

Result MembershipRegistry::onNodeDiscovered(const NodeAddress& address,
                                            const CapabilitySet& caps,
                                            const std::optional<VersionInfo>& version) {
    if (auto ok = check_dispatch(address); !ok) return ok;

    // Rules are tried in precedence order. A bridge match always ends the
    // walk. A singleton role only claims the node when it binds (or already
    // holds this very address); if it is held elsewhere the node is offered
    // to the next rule.
    const auto roles = matching_roles(caps);
    for (const Role role : roles) {
        if (role == Role::BridgeNode) {
            deps_.bridge_pool->add(address, version);
            emit(ChangeKind::BridgeForwarded, role, address,
                 version ? to_string(*version) : std::string{});
            return {};
        }
        const Claim c = claim_singleton(role, address);
        if (c != Claim::HeldElsewhere) return {};
    }

    if (!server_identity_.empty() && address == server_identity_) {
        record_server_version(address, version);
        return {};
    }

    if (roles.empty()) emit(ChangeKind::Unrecognized, std::nullopt, address);
    return {};
}

Result MembershipRegistry::onNodeLost(const NodeAddress& address) {
    if (auto ok = check_dispatch(address); !ok) return ok;

    // Independent handlers: an address may appear in more than one place.
    if (deps_.bridge_pool->contains(address)) {
        deps_.bridge_pool->remove(address);
        emit(ChangeKind::BridgeRemoved, Role::BridgeNode, address);
    }
    release_singleton(Role::SipGateway, address);
    release_singleton(Role::RoomService, address);
    return {};
}

Result MembershipRegistry::onHealthCheckFailed(const NodeAddress& address) {
    if (auto ok = check_dispatch(address); !ok) return ok;

    deps_.bridge_pool->remove(address);
    emit(ChangeKind::HealthEviction, Role::BridgeNode, address);
    return {};
}

//------------------------------- Bindings -------------------------------------

namespace {
    std::optional<NodeAddress>& slot_of(Bindings& b, Role role) noexcept {
        return role == Role::SipGateway ? b.sip_gateway : b.room_service;
    }
}

MembershipRegistry::Claim
MembershipRegistry::claim_singleton(Role role, const NodeAddress& address) {
    std::optional<NodeAddress> holder;
    {
        std::lock_guard<std::mutex> lk(write_mu_);
        auto snap = bindings();
        Bindings next = *snap;
        auto& slot = slot_of(next, role);
        if (slot) {
            holder = slot;
        } else {
            slot = address;
            next.generation = snap->generation + 1;
            publish(std::make_shared<Bindings>(std::move(next)));
        }
    }

    if (!holder) {
        emit(ChangeKind::Bound, role, address);
        return Claim::Bound;
    }
    if (*holder == address) return Claim::AlreadyHeld;

    // First discovered holder keeps the role until it is lost. Whether a
    // second announcer is a duplicate broadcast or a real conflict is not
    // decided here; it is only made visible.
    emit(ChangeKind::ConflictIgnored, role, address, "held by " + holder->value);
    return Claim::HeldElsewhere;
}

bool MembershipRegistry::release_singleton(Role role, const NodeAddress& address) {
    {
        std::lock_guard<std::mutex> lk(write_mu_);
        auto snap = bindings();
        Bindings next = *snap;
        auto& slot = slot_of(next, role);
        if (!slot || *slot != address) return false;
        slot.reset();
        next.generation = snap->generation + 1;
        publish(std::make_shared<Bindings>(std::move(next)));
    }
    emit(ChangeKind::Unbound, role, address);
    return true;
}

void MembershipRegistry::record_server_version(const NodeAddress& address,
                                               const std::optional<VersionInfo>& version) {
    {
        std::lock_guard<std::mutex> lk(write_mu_);
        auto snap = bindings();
        auto next = std::make_shared<Bindings>(*snap);
        next->server_version = version;
        next->generation = snap->generation + 1;
        publish(std::move(next));
    }
    emit(ChangeKind::ServerVersion, Role::ServerIdentity, address,
         version ? to_string(*version) : std::string{});
}

void MembershipRegistry::publish(std::shared_ptr<Bindings> next) noexcept {
    std::shared_ptr<const Bindings> cnext = std::move(next);
    std::atomic_store_explicit(&bindings_, std::move(cnext), std::memory_order_release);
}

void MembershipRegistry::emit(ChangeKind kind, std::optional<Role> role,
                              const NodeAddress& address, std::string detail) const {
    if (!deps_.observer) return;
    deps_.observer->record(roster::obs::ChangeEvent{kind, role, address, std::move(detail)});
}

//------------------------------- Reads ----------------------------------------

std::shared_ptr<const Bindings> MembershipRegistry::bindings() const noexcept {
    return std::atomic_load_explicit(&bindings_, std::memory_order_acquire);
}

std::optional<NodeAddress> MembershipRegistry::getSipGateway() const noexcept {
    return bindings()->sip_gateway;
}

std::optional<NodeAddress> MembershipRegistry::getRoomService() const noexcept {
    return bindings()->room_service;
}

std::optional<VersionInfo> MembershipRegistry::getServerVersion() const noexcept {
    return bindings()->server_version;
}

std::optional<VersionInfo> MembershipRegistry::getBridgeVersion(const NodeAddress& address) const {
    if (!deps_.bridge_pool) return std::nullopt;
    return deps_.bridge_pool->lookupVersion(address);
}

Detector* MembershipRegistry::detector(DetectorKind kind) const noexcept {
    if (state() != State::Running) return nullptr;
    return detectors_[static_cast<std::size_t>(kind)].get();
}

} // namespace roster::membership
