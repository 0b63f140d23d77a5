/**
 * @file config_loader.cpp
 * @brief JSON configuration parser filling RosterConfig over named defaults.
 */
#include "roster/config/config_loader.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace roster::config {
    using namespace roster::config::constants;
    using json = nlohmann::json;

    namespace {
        roster_detail::unexpected<ConfigError> fail(ConfigErrc c, std::string key, std::string msg,
                                                    std::size_t offset = 0) {
            return roster_detail::unexpected<ConfigError>(
                ConfigError{c, offset, std::move(key), std::move(msg)});
        }

        bool is_pow2(std::uint64_t v) noexcept { return v != 0 && (v & (v - 1)) == 0; }

        std::string path_of(std::string_view section, std::string_view key) {
            return std::string(section) + "." + std::string(key);
        }

        /// Member @p key of @p obj, or nullptr when absent or null.
        const json* member(const json& obj, std::string_view key) {
            auto it = obj.find(std::string(key));
            if (it == obj.end() || it->is_null()) return nullptr;
            return &*it;
        }

        /// Copy a string member into @p out; absent members leave the default.
        roster_detail::expected<void, ConfigError>
        read_string(const json& section, std::string_view section_name,
                    std::string_view key, std::string& out) {
            const json* v = member(section, key);
            if (!v) return {};
            if (!v->is_string()) {
                return fail(ConfigErrc::InvalidValue, path_of(section_name, key), "expected a string");
            }
            out = v->get<std::string>();
            return {};
        }

        roster_detail::expected<void, ConfigError>
        read_membership(const json& doc, MembershipConfig& m) {
            const json* sec = member(doc, CFG_MEMBERSHIP);
            if (!sec) return {};
            if (!sec->is_object()) {
                return fail(ConfigErrc::InvalidValue, std::string(CFG_MEMBERSHIP), "expected an object");
            }
            const std::pair<std::string_view, std::string*> fields[] = {
                {CFG_SERVER_IDENTITY,   &m.server_identity},
                {CFG_JIBRI_BREWERY,     &m.jibri_brewery},
                {CFG_JIGASI_BREWERY,    &m.jigasi_brewery},
                {CFG_JIBRI_SIP_BREWERY, &m.jibri_sip_brewery},
            };
            for (const auto& [key, out] : fields) {
                if (auto r = read_string(*sec, CFG_MEMBERSHIP, key, *out); !r) return r;
            }
            return {};
        }

        roster_detail::expected<void, ConfigError>
        read_dispatch(const json& doc, DispatchConfig& d) {
            const json* sec = member(doc, CFG_DISPATCH);
            if (!sec) return {};
            if (!sec->is_object()) {
                return fail(ConfigErrc::InvalidValue, std::string(CFG_DISPATCH), "expected an object");
            }
            const json* cap = member(*sec, CFG_QUEUE_CAPACITY);
            if (!cap) return {};

            const auto key = path_of(CFG_DISPATCH, CFG_QUEUE_CAPACITY);
            if (!cap->is_number_unsigned()) {
                return fail(ConfigErrc::InvalidValue, key, "expected an unsigned integer");
            }
            // One ring slot always stays empty, so 2 is the smallest usable size.
            const auto v = cap->get<std::uint64_t>();
            if (!is_pow2(v) || v < 2 || v > DISPATCH_QUEUE_MAX) {
                return fail(ConfigErrc::InvalidValue, key, "queue capacity must be a power of two in [2, max]");
            }
            d.queue_capacity = static_cast<std::size_t>(v);
            return {};
        }
    }

    RosterConfig Loader::defaults() {
        return RosterConfig{};
    }

    roster_detail::expected<RosterConfig, ConfigError> Loader::parse(std::string_view text) {
        json doc;
        try {
            doc = json::parse(text.begin(), text.end(), /*cb=*/nullptr,
                              /*allow_exceptions=*/true, /*ignore_comments=*/true);
        } catch (const json::parse_error& e) {
            return fail(ConfigErrc::Malformed, {}, e.what(), e.byte);
        }
        if (!doc.is_object()) {
            return fail(ConfigErrc::Malformed, {}, "top level must be an object");
        }

        RosterConfig rc = defaults();
        if (auto r = read_membership(doc, rc.membership); !r) return roster_detail::unexpected(r.error());
        if (auto r = read_dispatch(doc, rc.dispatch); !r)     return roster_detail::unexpected(r.error());
        return rc;
    }

    roster_detail::expected<RosterConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        if (path.empty()) return defaults();

        std::ifstream in(path);
        if (!in) {
            return fail(ConfigErrc::FileUnreadable, {}, "cannot open " + path);
        }
        const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        return parse(text);
    }

} // namespace roster::config
