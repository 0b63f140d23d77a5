// BridgeRegistry: RCU Implementation Notes
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: lock write_mu_, copy current map, mutate, atomic_store (RELEASE).
// The write mutex only orders writers against each other; a reader holding an
// old snapshot keeps it alive until it drops its reference.

#include "roster/membership/bridge_registry.hpp"

#include <stdexcept>
#include <utility>

namespace roster::membership {

//------------------------------- Lifecycle ------------------------------------

void BridgeRegistry::init() {
    running_.store(true, std::memory_order_release);
}

void BridgeRegistry::dispose() {
    std::lock_guard<std::mutex> lk(write_mu_);
    publish(std::make_shared<Map>());
    running_.store(false, std::memory_order_release);
}

//------------------------------- Reads ----------------------------------------

std::shared_ptr<const BridgeRegistry::Map>
BridgeRegistry::snapshot() const noexcept {
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

bool BridgeRegistry::contains(const NodeAddress& address) const {
    auto snap = snapshot();
    return snap && snap->find(address) != snap->end();
}

std::optional<VersionInfo> BridgeRegistry::lookupVersion(const NodeAddress& address) const {
    auto snap = snapshot();
    if (!snap) return std::nullopt;
    auto it = snap->find(address);
    if (it == snap->end()) return std::nullopt;
    return it->second.version; // copy
}

std::size_t BridgeRegistry::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

std::vector<BridgeRecord> BridgeRegistry::listBridges() const {
    std::vector<BridgeRecord> out;
    auto snap = snapshot();
    if (!snap) return out;
    out.reserve(snap->size());
    for (const auto& kv : *snap) out.push_back(kv.second);
    return out;
}

BridgeRegistry::Stats BridgeRegistry::stats() const noexcept {
    return Stats{
        adds_.load(std::memory_order_relaxed),
        refreshes_.load(std::memory_order_relaxed),
        removes_.load(std::memory_order_relaxed),
        failures_.load(std::memory_order_relaxed)};
}

//------------------------------- Mutations ------------------------------------

void BridgeRegistry::add(const NodeAddress& address, const std::optional<VersionInfo>& version) {
    if (address.empty()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw std::invalid_argument("bridge address is empty");
    }

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    auto it = snap->find(address);
    if (it != snap->end()) {
        if (it->second.version == version) return; // duplicate announcement
        auto next = std::make_shared<Map>(*snap);
        (*next)[address].version = version;
        publish(std::move(next));
        refreshes_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    if (snap->size() >= Limits::MaxBridges) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw std::length_error("bridge pool full: " + address.value);
    }
    auto next = std::make_shared<Map>(*snap); // copy-on-write
    next->emplace(address, BridgeRecord{address, version});
    publish(std::move(next));
    adds_.fetch_add(1, std::memory_order_relaxed);
}

void BridgeRegistry::remove(const NodeAddress& address) {
    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (snap->find(address) == snap->end()) return;

    auto next = std::make_shared<Map>(*snap);
    next->erase(address);
    publish(std::move(next));
    removes_.fetch_add(1, std::memory_order_relaxed);
}

void BridgeRegistry::publish(std::shared_ptr<Map> next) noexcept {
    // RELEASE pairs with reader ACQUIRE: readers that load the new pointer
    // also see the fully built map.
    std::shared_ptr<const Map> cnext = std::move(next);
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace roster::membership
