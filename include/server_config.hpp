#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace keydir {

// Core server configuration. Defaults below, overridden by KEYDIR_* environment
// variables (apply_env_overrides) and command-line flags in main.
struct ServerConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = true;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Key Store Backend ---
    bool use_memory_store = false; // single-process development mode
    std::string redis_url = "tcp://127.0.0.1:6379";
    std::string redis_password = "";
    std::string redis_username = "";
    size_t redis_pool_size = 16;
    int storage_timeout_ms = 500;   // socket, connect and pool-wait bound
    int request_timeout_ms = 2000;  // deadline carried by every store call

    // --- Pre-Key Policy ---
    size_t replenish_threshold = 20;
    size_t max_one_time_pre_keys_per_upload = 100;

    // --- Request Limits ---
    size_t max_message_size = 64 * 1024;
    size_t max_json_depth = 16;

    // --- Identity & Secrets ---
    // Header carrying the caller id, set by the authenticating gateway.
    std::string identity_header = "X-User-Id";
    std::string secret_salt = "keydir_default_deployment_salt"; // MUST be overridden via ENV in production
    std::string admin_token = ""; // Guards /metrics and the replenishment trigger

    // --- Cross-Origin Resource Sharing (CORS) ---
    std::vector<std::string> allowed_origins = {};
};

// Salt shipped in the defaults; the server refuses to start with it.
extern const char* const kDefaultSecretSalt;

/**
 * Applies KEYDIR_* environment overrides to the configuration.
 * @throws std::invalid_argument / std::out_of_range on malformed numeric values.
 */
void apply_env_overrides(ServerConfig& config);

} // namespace keydir
