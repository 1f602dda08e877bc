#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace keydir {

using Bytes = std::vector<unsigned char>;

// Every storage interaction carries the caller's deadline.
using Deadline = std::chrono::steady_clock::time_point;

// Fixed encodings accepted by the directory.
constexpr std::size_t kIdentityKeySize = 32;   // Ed25519 public key
constexpr std::size_t kPreKeySize = 32;        // X25519 public key
constexpr std::size_t kSignatureSize = 64;     // Ed25519 signature

// Long-term signing key. One row per user, overwritten on re-upload.
struct IdentityKey {
    std::string user_id;
    Bytes public_key;
    std::int64_t created_at = 0; // unix millis
};

// Medium-term key-agreement key, signed by the identity key.
struct SignedPreKey {
    std::uint32_t key_id = 0;
    std::string user_id;
    Bytes public_key;
    Bytes signature;
    std::int64_t created_at = 0;
};

// Single-use key-agreement key. `used` never reverts once set.
struct OneTimePreKey {
    std::uint32_t key_id = 0;
    std::string user_id;
    Bytes public_key;
    bool used = false;
    std::int64_t created_at = 0;
};

// Assembled per fetch, never persisted.
struct PreKeyBundle {
    std::string user_id;
    IdentityKey identity_key;
    SignedPreKey signed_pre_key;
    std::optional<OneTimePreKey> one_time_pre_key;
};

// One atomic write against the store: the identity key is absent for rotations.
struct KeyCommit {
    std::string user_id;
    std::optional<IdentityKey> identity_key;
    SignedPreKey signed_pre_key;
    std::vector<OneTimePreKey> one_time_pre_keys;
};

inline std::int64_t unix_millis_now() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline Deadline deadline_after(std::chrono::milliseconds timeout) {
    return std::chrono::steady_clock::now() + timeout;
}

} // namespace keydir
