#pragma once

#include <cstddef>
#include <string>

#include "key_codec.hpp"
#include "key_store.hpp"

namespace keydir {

enum class UploadStatus {
    Accepted,
    InvalidKey,        // malformed encoding or oversized batch
    InvalidSignature,  // signed pre-key not signed by the identity key
    UnknownIdentity,   // rotation before any identity key was uploaded
    StorageError
};

struct UploadResult {
    UploadStatus status = UploadStatus::Accepted;
    std::size_t one_time_keys_stored = 0;
    std::string detail;
};

// Signature-gated key ingestion. Nothing is written unless validation and
// signature verification both pass, and the write itself is one atomic commit.
class KeyIngestionService {
public:
    KeyIngestionService(KeyStore& store, std::size_t max_one_time_pre_keys)
        : store_(store), max_one_time_pre_keys_(max_one_time_pre_keys) {}

    /**
     * Verify, upsert the identity key, insert the signed pre-key and the
     * one-time pre-key batch. Idempotent on duplicate one-time key ids, so a
     * StorageError result may be retried as a whole.
     */
    UploadResult upload_keys(const KeyUpload& upload, Deadline deadline);

    // Stores a new signed pre-key (plus optional one-time keys) verified
    // against the identity key already on file.
    UploadResult rotate_signed_pre_key(const KeyRotation& rotation, Deadline deadline);

private:
    KeyStore& store_;
    std::size_t max_one_time_pre_keys_;

    bool validate_shapes(const SignedPreKey& spk, const std::vector<OneTimePreKey>& otks, std::string& detail) const;
    UploadResult apply_commit(const KeyCommit& commit, Deadline deadline);
};

} // namespace keydir
