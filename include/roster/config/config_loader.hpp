#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader for JSON configuration documents.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstddef>
#include <string>
#include <string_view>

#include "roster/compat/expected.hpp"
#include "roster/config/constants.hpp"

namespace roster::config {

    /** @struct MembershipConfig
     *  @brief Inputs of MembershipRegistry::init().
     *  @details An empty brewery name disables the matching detector. An empty
     *           server identity disables version tracking for the server.
     */
    struct MembershipConfig {
        std::string server_identity;   ///< Well-known signalling server address
        std::string jibri_brewery;     ///< Recorder brewery room
        std::string jigasi_brewery;    ///< SIP gateway brewery room
        std::string jibri_sip_brewery; ///< SIP recorder brewery room
    };

    /** @struct DispatchConfig
     *  @brief Sizing of the transport → dispatch hand-off ring.
     */
    struct DispatchConfig {
        std::size_t queue_capacity{constants::DISPATCH_QUEUE_CAPACITY}; ///< Power of two
    };

    /** @struct RosterConfig
     *  @brief Aggregate of sub-configs required by the process.
     */
    struct RosterConfig {
        MembershipConfig membership; ///< Registry identity + detector names
        DispatchConfig   dispatch;   ///< Event pump sizing
    };

    /** @enum ConfigErrc
     *  @brief Why a configuration could not be produced.
     */
    enum class ConfigErrc {
        FileUnreadable, ///< Path could not be opened
        Malformed,      ///< Not a JSON document, or the top level is not an object
        InvalidValue    ///< A known member has the wrong type or is out of range
    };

    /** @struct ConfigError
     *  @brief Error value: byte offset for Malformed, member path for InvalidValue.
     */
    struct ConfigError {
        ConfigErrc  code;
        std::size_t offset{0};
        std::string key;
        std::string message;
    };

    /** @class Loader
     *  @brief Source of process configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Named defaults, no file involved.
        static RosterConfig defaults();

        /**
         * @brief Parse a JSON document with optional "membership" and "dispatch" objects.
         * @details Missing members keep their defaults. Unknown members are skipped;
         *          the file is shared with other subsystems. Comments are allowed.
         */
        static roster_detail::expected<RosterConfig, ConfigError> parse(std::string_view text);

        /**
         * @brief Load configuration from a path.
         * @param path File path; empty means "defaults".
         */
        static roster_detail::expected<RosterConfig, ConfigError> load_from_file(const std::string& path);
    };

} // namespace roster::config
