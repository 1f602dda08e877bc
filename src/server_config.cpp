#include "server_config.hpp"
#include <cstdlib>

namespace keydir {

const char* const kDefaultSecretSalt = "keydir_default_deployment_salt";

void apply_env_overrides(ServerConfig& config) {
    if (const char* e = std::getenv("KEYDIR_PORT")) config.port = static_cast<uint16_t>(std::stoi(e));
    if (const char* e = std::getenv("KEYDIR_ADDR")) config.address = e;
    if (const char* e = std::getenv("KEYDIR_THREADS")) config.thread_count = std::stoi(e);

    if (const char* e = std::getenv("KEYDIR_REDIS_URL")) config.redis_url = e;
    if (const char* e = std::getenv("KEYDIR_REDIS_PASSWORD")) config.redis_password = e;
    if (const char* e = std::getenv("KEYDIR_REDIS_USERNAME")) config.redis_username = e;
    if (const char* e = std::getenv("KEYDIR_REDIS_POOL_SIZE")) config.redis_pool_size = static_cast<size_t>(std::stoull(e));
    if (const char* e = std::getenv("KEYDIR_STORAGE_TIMEOUT_MS")) config.storage_timeout_ms = std::stoi(e);
    if (const char* e = std::getenv("KEYDIR_REQUEST_TIMEOUT_MS")) config.request_timeout_ms = std::stoi(e);
    if (const char* e = std::getenv("KEYDIR_MEMORY_STORE")) config.use_memory_store = std::string(e) == "1";

    if (const char* e = std::getenv("KEYDIR_REPLENISH_THRESHOLD")) config.replenish_threshold = static_cast<size_t>(std::stoull(e));
    if (const char* e = std::getenv("KEYDIR_MAX_PREKEYS_PER_UPLOAD")) config.max_one_time_pre_keys_per_upload = static_cast<size_t>(std::stoull(e));

    if (const char* e = std::getenv("KEYDIR_TLS")) config.enable_tls = std::string(e) == "1";
    if (const char* e = std::getenv("KEYDIR_TLS_CERT")) config.cert_path = e;
    if (const char* e = std::getenv("KEYDIR_TLS_KEY")) config.key_path = e;

    if (const char* e = std::getenv("KEYDIR_IDENTITY_HEADER")) config.identity_header = e;
    if (const char* e = std::getenv("KEYDIR_SECRET_SALT")) config.secret_salt = e;
    if (const char* e = std::getenv("KEYDIR_ADMIN_TOKEN")) config.admin_token = e;

    if (const char* env_origins = std::getenv("KEYDIR_ALLOWED_ORIGINS")) {
        config.allowed_origins.clear();
        std::string origins_str(env_origins);
        size_t pos = 0;
        while ((pos = origins_str.find(',')) != std::string::npos) {
            config.allowed_origins.push_back(origins_str.substr(0, pos));
            origins_str.erase(0, pos + 1);
        }
        if (!origins_str.empty()) {
            config.allowed_origins.push_back(origins_str);
        }
    }
}

} // namespace keydir
