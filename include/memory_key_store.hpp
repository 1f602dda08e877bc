#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "key_store.hpp"

namespace keydir {

// In-process KeyStore. A single timed mutex serializes every operation, which
// makes each call one transaction; lock waits are bounded by the caller's
// deadline. Writes are staged on a copy of the user's record and swapped in
// only after the whole commit succeeded.
class MemoryKeyStore : public KeyStore {
public:
    MemoryKeyStore() = default;
    ~MemoryKeyStore() override = default;

    std::size_t commit_keys(const KeyCommit& commit, Deadline deadline) override;
    std::optional<IdentityKey> get_identity_key(const std::string& user_id, Deadline deadline) override;
    std::optional<SignedPreKey> get_latest_signed_pre_key(const std::string& user_id, Deadline deadline) override;
    std::optional<OneTimePreKey> claim_one_time_pre_key(const std::string& user_id, Deadline deadline) override;
    std::size_t count_unused_one_time_pre_keys(const std::string& user_id, Deadline deadline) override;
    bool is_available() override { return true; }

protected:
    // Called for every one-time pre-key staged by commit_keys. Throwing aborts
    // the commit with nothing applied.
    virtual void on_one_time_pre_key_staged(const OneTimePreKey& key, std::size_t index) {
        (void)key;
        (void)index;
    }

private:
    struct SignedEntry {
        SignedPreKey key;
        std::uint64_t sequence = 0;
    };

    struct UserRecord {
        std::optional<IdentityKey> identity_key;
        std::map<std::uint32_t, SignedEntry> signed_pre_keys;
        std::uint64_t next_sequence = 1;
        std::map<std::uint32_t, OneTimePreKey> one_time_pre_keys;
        std::deque<std::uint32_t> unused; // FIFO by insertion
    };

    std::unique_lock<std::timed_mutex> acquire(Deadline deadline, const char* operation);

    std::timed_mutex mutex_;
    std::unordered_map<std::string, UserRecord> users_;
};

} // namespace keydir
