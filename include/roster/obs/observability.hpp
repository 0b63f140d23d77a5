#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: membership change events + counters.
 */

#include <cstdint>
#include <optional>
#include <string>

#include "roster/membership/node.hpp"

namespace roster::obs {

    /** @enum ChangeKind
     *  @brief What happened to the membership view.
     */
    enum class ChangeKind : uint8_t {
        Bound,            ///< Singleton role bound to an address
        Unbound,          ///< Singleton role cleared by a loss event
        ServerVersion,    ///< Server identity version recorded
        BridgeForwarded,  ///< Bridge discovery forwarded to the pool
        BridgeRemoved,    ///< Bridge loss forwarded to the pool
        HealthEviction,   ///< Health failure forwarded to the pool
        ConflictIgnored,  ///< Singleton already bound elsewhere; discovery ignored
        Unrecognized      ///< Capability set matched no role
    };

    const char* to_string(ChangeKind k) noexcept;

    /** @struct Counters
     *  @brief Cumulative per-kind counters.
     */
    struct Counters {
        uint64_t bound{0};
        uint64_t unbound{0};
        uint64_t server_versions{0};
        uint64_t bridge_forwards{0};
        uint64_t bridge_removals{0};
        uint64_t health_evictions{0};
        uint64_t conflicts_ignored{0};
        uint64_t unrecognized{0};
    };

    /// Bump the counter matching @p k.
    void count(Counters& c, ChangeKind k) noexcept;

    /** @struct ChangeEvent
     *  @brief Payload describing one membership change.
     */
    struct ChangeEvent {
        ChangeKind                                kind{ChangeKind::Unrecognized};
        std::optional<roster::membership::Role>   role;     ///< Role concerned, if any
        roster::membership::NodeAddress           address;  ///< Node concerned
        std::string                               detail;   ///< Free text (version, previous holder)
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single change event.
        virtual void record(const ChangeEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// One JSON object (no trailing newline) describing @p e; strings are escaped.
    std::string format_line(const ChangeEvent& e);

    /// Process-wide printf-backed JSON-lines observer.
    Observer* make_simple_observer();

} // namespace roster::obs
