#include "memory_key_store.hpp"

namespace keydir {

std::unique_lock<std::timed_mutex> MemoryKeyStore::acquire(Deadline deadline, const char* operation) {
    if (std::chrono::steady_clock::now() >= deadline) {
        throw StorageError(std::string(operation) + ": deadline exceeded");
    }
    std::unique_lock<std::timed_mutex> lock(mutex_, deadline);
    if (!lock.owns_lock()) {
        throw StorageError(std::string(operation) + ": lock wait exceeded deadline");
    }
    return lock;
}

std::size_t MemoryKeyStore::commit_keys(const KeyCommit& commit, Deadline deadline) {
    auto lock = acquire(deadline, "commit_keys");

    UserRecord staged;
    auto it = users_.find(commit.user_id);
    if (it != users_.end()) staged = it->second;

    const std::int64_t now = unix_millis_now();

    if (commit.identity_key) {
        IdentityKey ik = *commit.identity_key;
        ik.user_id = commit.user_id;
        ik.created_at = now;
        staged.identity_key = std::move(ik);
    }

    SignedEntry entry;
    entry.key = commit.signed_pre_key;
    entry.key.user_id = commit.user_id;
    entry.key.created_at = now;
    entry.sequence = staged.next_sequence++;
    staged.signed_pre_keys[entry.key.key_id] = std::move(entry);

    std::size_t inserted = 0;
    for (std::size_t i = 0; i < commit.one_time_pre_keys.size(); ++i) {
        OneTimePreKey otk = commit.one_time_pre_keys[i];
        otk.user_id = commit.user_id;
        otk.used = false;
        otk.created_at = now;
        on_one_time_pre_key_staged(otk, i);

        // Known ids, used or not, are idempotent retries.
        if (staged.one_time_pre_keys.count(otk.key_id)) continue;
        staged.unused.push_back(otk.key_id);
        staged.one_time_pre_keys.emplace(otk.key_id, std::move(otk));
        ++inserted;
    }

    users_[commit.user_id] = std::move(staged);
    return inserted;
}

std::optional<IdentityKey> MemoryKeyStore::get_identity_key(const std::string& user_id, Deadline deadline) {
    auto lock = acquire(deadline, "get_identity_key");
    auto it = users_.find(user_id);
    if (it == users_.end()) return std::nullopt;
    return it->second.identity_key;
}

std::optional<SignedPreKey> MemoryKeyStore::get_latest_signed_pre_key(const std::string& user_id, Deadline deadline) {
    auto lock = acquire(deadline, "get_latest_signed_pre_key");
    auto it = users_.find(user_id);
    if (it == users_.end()) return std::nullopt;

    const SignedEntry* latest = nullptr;
    for (const auto& [key_id, entry] : it->second.signed_pre_keys) {
        if (!latest || entry.sequence > latest->sequence) latest = &entry;
    }
    if (!latest) return std::nullopt;
    return latest->key;
}

std::optional<OneTimePreKey> MemoryKeyStore::claim_one_time_pre_key(const std::string& user_id, Deadline deadline) {
    auto lock = acquire(deadline, "claim_one_time_pre_key");
    auto it = users_.find(user_id);
    if (it == users_.end()) return std::nullopt;

    auto& record = it->second;
    if (record.unused.empty()) return std::nullopt;

    std::uint32_t key_id = record.unused.front();
    record.unused.pop_front();

    auto& key = record.one_time_pre_keys.at(key_id);
    key.used = true;
    return key;
}

std::size_t MemoryKeyStore::count_unused_one_time_pre_keys(const std::string& user_id, Deadline deadline) {
    auto lock = acquire(deadline, "count_unused_one_time_pre_keys");
    auto it = users_.find(user_id);
    if (it == users_.end()) return 0;
    return it->second.unused.size();
}

} // namespace keydir
