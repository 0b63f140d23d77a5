#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the membership layer.
 * @details Protocol feature identifiers, configuration keys and dispatch
 *          defaults live here so no component carries string or numeric
 *          literals of its own.
 */

#include <cstddef>
#include <string_view>

namespace roster::config::constants {

// =====================
// Service Discovery features (XEP-0030 disco#info "var" values)
// =====================
/// COLIBRI conference control, advertised by media bridges.
inline constexpr std::string_view FEATURE_COLIBRI       = "http://jitsi.org/protocol/colibri";
/// Jingle DTLS-SRTP application support.
inline constexpr std::string_view FEATURE_DTLS_SRTP     = "urn:xmpp:jingle:apps:dtls:0";
/// Jingle ICE-UDP transport.
inline constexpr std::string_view FEATURE_ICE_UDP       = "urn:xmpp:jingle:transports:ice-udp:1";
/// Jingle RAW-UDP transport.
inline constexpr std::string_view FEATURE_RAW_UDP       = "urn:xmpp:jingle:transports:raw-udp:1";
/// SIP gateway component namespace.
inline constexpr std::string_view FEATURE_JIGASI        = "http://jitsi.org/protocol/jigasi";
/// Rayo call control (XEP-0327).
inline constexpr std::string_view FEATURE_RAYO          = "urn:xmpp:rayo:0";
/// Multi-User Chat (XEP-0045).
inline constexpr std::string_view FEATURE_MUC           = "http://jabber.org/protocol/muc";

// =====================
// Configuration document keys (JSON objects and members)
// =====================
inline constexpr std::string_view CFG_MEMBERSHIP        = "membership";
inline constexpr std::string_view CFG_SERVER_IDENTITY   = "server_identity";
inline constexpr std::string_view CFG_JIBRI_BREWERY     = "jibri_brewery";
inline constexpr std::string_view CFG_JIGASI_BREWERY    = "jigasi_brewery";
inline constexpr std::string_view CFG_JIBRI_SIP_BREWERY = "jibri_sip_brewery";
inline constexpr std::string_view CFG_DISPATCH          = "dispatch";
inline constexpr std::string_view CFG_QUEUE_CAPACITY    = "queue_capacity";

// =====================
// Dispatch defaults
// =====================
/// Ring size between the discovery transport and the dispatch context (power of two).
inline constexpr std::size_t DISPATCH_QUEUE_CAPACITY   = 1024;
/// Upper bound accepted from configuration; larger rings are a typo, not a need.
inline constexpr std::size_t DISPATCH_QUEUE_MAX        = 1u << 20;

} // namespace roster::config::constants
