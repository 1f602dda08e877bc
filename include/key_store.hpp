#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "key_types.hpp"

namespace keydir {

// Raised by every KeyStore implementation for timeouts, lost connections,
// expired deadlines and backend protocol errors. Nothing written by the failed
// call is visible afterwards.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Abstract persistence for identity keys, signed pre-keys and one-time pre-keys.
// The primary implementation is Redis (atomic Lua scripts); MemoryKeyStore
// serves single-process deployments and tests.
class KeyStore {
public:
    virtual ~KeyStore() = default;

    /**
     * Applies an upload or rotation as one atomic unit: identity upsert (if
     * present), signed pre-key insert/replace and one-time pre-key batch insert.
     * One-time keys whose key_id is already known for the user are skipped.
     * @return Number of one-time pre-keys newly stored.
     * @throws StorageError with nothing persisted.
     */
    virtual std::size_t commit_keys(const KeyCommit& commit, Deadline deadline) = 0;

    virtual std::optional<IdentityKey> get_identity_key(const std::string& user_id, Deadline deadline) = 0;

    // Row stored most recently for the user.
    virtual std::optional<SignedPreKey> get_latest_signed_pre_key(const std::string& user_id, Deadline deadline) = 0;

    /**
     * Selects the oldest unused one-time pre-key and marks it used in a single
     * atomic step. Concurrent callers never receive the same key.
     * @return The claimed key, or nullopt when the pool is exhausted.
     */
    virtual std::optional<OneTimePreKey> claim_one_time_pre_key(const std::string& user_id, Deadline deadline) = 0;

    virtual std::size_t count_unused_one_time_pre_keys(const std::string& user_id, Deadline deadline) = 0;

    // Backend health for /health.
    virtual bool is_available() = 0;
};

} // namespace keydir
