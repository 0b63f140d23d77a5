/**
 * @file observability.cpp
 * @brief printf-backed Observer writing one JSON line per change.
 */
#include "roster/obs/observability.hpp"
#include <mutex>
#include <cstdio>

#include <nlohmann/json.hpp>

namespace roster::obs {

    const char* to_string(ChangeKind k) noexcept {
        switch (k) {
            case ChangeKind::Bound:           return "bound";
            case ChangeKind::Unbound:         return "unbound";
            case ChangeKind::ServerVersion:   return "server_version";
            case ChangeKind::BridgeForwarded: return "bridge_forwarded";
            case ChangeKind::BridgeRemoved:   return "bridge_removed";
            case ChangeKind::HealthEviction:  return "health_eviction";
            case ChangeKind::ConflictIgnored: return "conflict_ignored";
            case ChangeKind::Unrecognized:    return "unrecognized";
        }
        return "unknown";
    }

    void count(Counters& c, ChangeKind k) noexcept {
        switch (k) {
            case ChangeKind::Bound:           c.bound++; break;
            case ChangeKind::Unbound:         c.unbound++; break;
            case ChangeKind::ServerVersion:   c.server_versions++; break;
            case ChangeKind::BridgeForwarded: c.bridge_forwards++; break;
            case ChangeKind::BridgeRemoved:   c.bridge_removals++; break;
            case ChangeKind::HealthEviction:  c.health_evictions++; break;
            case ChangeKind::ConflictIgnored: c.conflicts_ignored++; break;
            case ChangeKind::Unrecognized:    c.unrecognized++; break;
        }
    }

    std::string format_line(const ChangeEvent& e) {
        nlohmann::ordered_json line{
            {"event",   to_string(e.kind)},
            {"role",    e.role ? roster::membership::to_string(*e.role) : ""},
            {"address", e.address.value},
            {"detail",  e.detail},
        };
        // Addresses and versions come off the wire; never throw on bad UTF-8.
        return line.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    }

    class SimpleObserver : public Observer {
    public:
        void record(const ChangeEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            count(ctr_, e.kind);
            // Unrecognized nodes are routine noise; count them, don't print them.
            if (e.kind == ChangeKind::Unrecognized) return;
            std::printf("%s\n", format_line(e).c_str());
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide sink
        return &obs;
    }

} // namespace roster::obs
