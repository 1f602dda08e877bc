#pragma once

#include <memory>
#include <string>
#include <vector>
#include <sw/redis++/redis++.h>

#include "key_store.hpp"

namespace keydir {

struct ServerConfig;

// Builds the shared connection pool from the configuration. The pool is owned
// by main and injected into every Redis-backed collaborator.
std::shared_ptr<sw::redis::Redis> make_redis_client(const ServerConfig& config);

// Redis-backed KeyStore.
//
// Layout per user (u = salted hash of the user id):
//   ik:u        hash   public_key, created_at
//   spk:u       hash   key_id -> "public_key|signature|created_at"
//   spk_idx:u   zset   key_id scored by insertion sequence
//   spk_seq:u   string insertion sequence counter
//   otk:u       hash   key_id -> "public_key|created_at" (used keys stay)
//   otk_free:u  list   unused key ids, oldest first
//   otk_used:u  set    claimed key ids
//
// Every multi-key mutation runs as one Lua script, which Redis executes
// atomically. Scripts check their whole argument set before the first write.
class RedisKeyStore : public KeyStore {
public:
    RedisKeyStore(std::shared_ptr<sw::redis::Redis> redis, const std::string& salt);
    ~RedisKeyStore() override = default;

    std::size_t commit_keys(const KeyCommit& commit, Deadline deadline) override;
    std::optional<IdentityKey> get_identity_key(const std::string& user_id, Deadline deadline) override;
    std::optional<SignedPreKey> get_latest_signed_pre_key(const std::string& user_id, Deadline deadline) override;
    std::optional<OneTimePreKey> claim_one_time_pre_key(const std::string& user_id, Deadline deadline) override;
    std::size_t count_unused_one_time_pre_keys(const std::string& user_id, Deadline deadline) override;
    bool is_available() override;

    // Permanently removes every key row of a user. Used by maintenance tooling
    // and test fixtures.
    void purge_user(const std::string& user_id);

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string server_salt_;

    std::string blind(const std::string& user_id) const;
    static void check_deadline(Deadline deadline, const char* operation);
};

} // namespace keydir
