#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the agent core.
 * @details Settings files override the configurable ones; the digest inputs
 *          are fixed so peers running the protocol test suite can predict
 *          the agent's identifiers.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace didagent::config::constants {

// =====================
// Setting keys
// =====================
inline constexpr std::string_view KEY_ADMIN_ENABLED        = "admin.enabled";
inline constexpr std::string_view KEY_ADMIN_HOST           = "admin.host";
inline constexpr std::string_view KEY_ADMIN_PORT           = "admin.port";
inline constexpr std::string_view KEY_ADMIN_WEBHOOK_URLS   = "admin.webhook_urls";
inline constexpr std::string_view KEY_DEFAULT_LABEL        = "default_label";
inline constexpr std::string_view KEY_DEFAULT_ENDPOINT     = "default_endpoint";
inline constexpr std::string_view KEY_INVITE_BASE_URL      = "invite_base_url";
inline constexpr std::string_view KEY_TEST_SUITE_ENDPOINT  = "debug.test_suite_endpoint";
inline constexpr std::string_view KEY_PRINT_INVITATION     = "debug.print_invitation";
inline constexpr std::string_view KEY_INVITE_ROLE          = "debug.invite_role";
inline constexpr std::string_view KEY_INVITE_LABEL         = "debug.invite_label";
inline constexpr std::string_view KEY_INVITE_MULTI_USE     = "debug.invite_multi_use";
inline constexpr std::string_view KEY_INVITE_PUBLIC        = "debug.invite_public";
inline constexpr std::string_view KEY_COLLECT_STATS        = "collect_stats";
inline constexpr std::string_view KEY_DISPATCH_WORKERS     = "dispatch.workers";
inline constexpr std::string_view KEY_LOG_LEVEL            = "log.level";
inline constexpr std::string_view KEY_STOP_TIMEOUT         = "stop_timeout";
inline constexpr std::string_view KEY_WALLET_SEED          = "wallet.seed";

// =====================
// Admin server bind defaults
// =====================
inline constexpr std::string_view ADMIN_DEFAULT_HOST = "0.0.0.0";
inline constexpr std::uint16_t    ADMIN_DEFAULT_PORT = 80;

// =====================
// Lifecycle
// =====================
/// Deadline for parallel shutdown of transports and the admin server.
inline constexpr std::chrono::milliseconds STOP_TIMEOUT_DEFAULT{1000};
/// Upper bound accepted for "stop_timeout".
inline constexpr std::chrono::milliseconds STOP_TIMEOUT_MAX{3600 * 1000};

/// Worker threads in the dispatcher's task queue.
inline constexpr std::size_t DISPATCH_WORKERS_DEFAULT = 4;

// =====================
// Protocol test-suite static connection
// =====================
/// SHA-256 input for this agent's seed.
inline constexpr std::string_view TEST_SUITE_SUBJECT_SEED_INPUT = "aries-protocol-test-subject";
/// SHA-256 input for the tester's seed.
inline constexpr std::string_view TEST_SUITE_TESTER_SEED_INPUT  = "aries-protocol-test-suite";
inline constexpr std::string_view TEST_SUITE_THEIR_ROLE         = "tester";
inline constexpr std::string_view TEST_SUITE_ALIAS              = "test-suite";

// =====================
// Key material
// =====================
inline constexpr std::size_t SEED_BYTES   = 32; ///< Ed25519-sized seed
inline constexpr std::size_t VERKEY_BYTES = 32;
inline constexpr std::size_t DID_BYTES    = 16; ///< DID = first 16 verkey bytes

} // namespace didagent::config::constants
