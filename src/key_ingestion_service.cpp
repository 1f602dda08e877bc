#include "key_ingestion_service.hpp"
#include "signature_verifier.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"

namespace keydir {

bool KeyIngestionService::validate_shapes(const SignedPreKey& spk, const std::vector<OneTimePreKey>& otks,
                                          std::string& detail) const {
    if (spk.public_key.size() != kPreKeySize) {
        detail = "signed pre-key must be " + std::to_string(kPreKeySize) + " bytes";
        return false;
    }
    if (spk.signature.size() != kSignatureSize) {
        detail = "signature must be " + std::to_string(kSignatureSize) + " bytes";
        return false;
    }
    if (otks.size() > max_one_time_pre_keys_) {
        detail = "too many one-time pre-keys (max " + std::to_string(max_one_time_pre_keys_) + ")";
        return false;
    }
    for (const auto& otk : otks) {
        if (otk.public_key.size() != kPreKeySize) {
            detail = "one-time pre-key " + std::to_string(otk.key_id) + " has the wrong length";
            return false;
        }
    }
    return true;
}

UploadResult KeyIngestionService::apply_commit(const KeyCommit& commit, Deadline deadline) {
    UploadResult result;
    try {
        result.one_time_keys_stored = store_.commit_keys(commit, deadline);
        result.status = UploadStatus::Accepted;
    } catch (const StorageError& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            commit.user_id, std::string("Key commit failed: ") + e.what());
        MetricsRegistry::instance().increment_counter("storage_errors_total");
        result.status = UploadStatus::StorageError;
        result.detail = e.what();
    }
    return result;
}

UploadResult KeyIngestionService::upload_keys(const KeyUpload& upload, Deadline deadline) {
    UploadResult result;

    if (upload.identity_key.size() != kIdentityKeySize) {
        result.status = UploadStatus::InvalidKey;
        result.detail = "identity key must be " + std::to_string(kIdentityKeySize) + " bytes";
    } else if (!validate_shapes(upload.signed_pre_key, upload.one_time_pre_keys, result.detail)) {
        result.status = UploadStatus::InvalidKey;
    }
    if (result.status == UploadStatus::InvalidKey) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            upload.user_id, "Upload rejected: " + result.detail);
        MetricsRegistry::instance().increment_counter("keys_upload_rejected_total");
        return result;
    }

    if (!SignatureVerifier::verify_signed_pre_key(upload.identity_key, upload.signed_pre_key)) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_SIGNATURE,
                            upload.user_id, "Upload rejected: signed pre-key signature does not verify");
        MetricsRegistry::instance().increment_counter("keys_upload_rejected_total");
        result.status = UploadStatus::InvalidSignature;
        result.detail = "signed pre-key signature does not verify";
        return result;
    }

    KeyCommit commit;
    commit.user_id = upload.user_id;
    IdentityKey ik;
    ik.user_id = upload.user_id;
    ik.public_key = upload.identity_key;
    commit.identity_key = std::move(ik);
    commit.signed_pre_key = upload.signed_pre_key;
    commit.one_time_pre_keys = upload.one_time_pre_keys;

    result = apply_commit(commit, deadline);
    if (result.status == UploadStatus::Accepted) {
        MetricsRegistry::instance().increment_counter("keys_upload_total");
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::KEYS_UPLOADED,
                            upload.user_id, "Stored " + std::to_string(result.one_time_keys_stored) + " new one-time pre-keys");
    }
    return result;
}

UploadResult KeyIngestionService::rotate_signed_pre_key(const KeyRotation& rotation, Deadline deadline) {
    UploadResult result;

    if (!validate_shapes(rotation.signed_pre_key, rotation.one_time_pre_keys, result.detail)) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            rotation.user_id, "Rotation rejected: " + result.detail);
        MetricsRegistry::instance().increment_counter("keys_upload_rejected_total");
        result.status = UploadStatus::InvalidKey;
        return result;
    }

    std::optional<IdentityKey> identity;
    try {
        identity = store_.get_identity_key(rotation.user_id, deadline);
    } catch (const StorageError& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            rotation.user_id, std::string("Identity lookup failed: ") + e.what());
        MetricsRegistry::instance().increment_counter("storage_errors_total");
        result.status = UploadStatus::StorageError;
        result.detail = e.what();
        return result;
    }

    if (!identity) {
        result.status = UploadStatus::UnknownIdentity;
        result.detail = "no identity key on file";
        return result;
    }

    if (!SignatureVerifier::verify_signed_pre_key(identity->public_key, rotation.signed_pre_key)) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_SIGNATURE,
                            rotation.user_id, "Rotation rejected: signature does not verify against identity key on file");
        MetricsRegistry::instance().increment_counter("keys_upload_rejected_total");
        result.status = UploadStatus::InvalidSignature;
        result.detail = "signed pre-key signature does not verify";
        return result;
    }

    KeyCommit commit;
    commit.user_id = rotation.user_id;
    commit.signed_pre_key = rotation.signed_pre_key;
    commit.one_time_pre_keys = rotation.one_time_pre_keys;

    result = apply_commit(commit, deadline);
    if (result.status == UploadStatus::Accepted) {
        MetricsRegistry::instance().increment_counter("keys_rotated_total");
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::KEYS_ROTATED,
                            rotation.user_id, "Signed pre-key " + std::to_string(rotation.signed_pre_key.key_id) + " is now current");
    }
    return result;
}

} // namespace keydir
