/**
 * @file node.cpp
 * @brief Text helpers for the node model.
 */
#include "roster/membership/node.hpp"

namespace roster::membership {

    const char* to_string(Role r) noexcept {
        switch (r) {
            case Role::BridgeNode:     return "bridge";
            case Role::SipGateway:     return "sip_gateway";
            case Role::RoomService:    return "room_service";
            case Role::ServerIdentity: return "server_identity";
        }
        return "unknown";
    }

    std::string to_string(const VersionInfo& v) {
        std::string out = v.name;
        if (!v.version.empty()) {
            if (!out.empty()) out += '/';
            out += v.version;
        }
        if (!v.os.empty()) {
            if (!out.empty()) out += ' ';
            out += "(" + v.os + ")";
        }
        return out;
    }

} // namespace roster::membership
