#include <gtest/gtest.h>
#include "key_ingestion_service.hpp"
#include "bundle_assembly_service.hpp"
#include "memory_key_store.hpp"
#include "metrics.hpp"
#include "test_helpers.hpp"

using namespace keydir;
using namespace keydir::testing_support;

namespace {

class BrokenMemoryKeyStore : public MemoryKeyStore {
protected:
    void on_one_time_pre_key_staged(const OneTimePreKey&, std::size_t) override {
        throw StorageError("connection reset");
    }
};

} // namespace

class KeyIngestionTest : public ::testing::Test {
protected:
    MemoryKeyStore store;
    KeyIngestionService service{store, 100};
    TestIdentity alice;
};

TEST_F(KeyIngestionTest, AcceptsValidUpload) {
    auto result = service.upload_keys(alice.upload("alice", 1, 1, 10), soon());
    EXPECT_EQ(result.status, UploadStatus::Accepted);
    EXPECT_EQ(result.one_time_keys_stored, 10u);

    EXPECT_EQ(store.get_identity_key("alice", soon())->public_key, alice.public_key());
    EXPECT_EQ(store.get_latest_signed_pre_key("alice", soon())->key_id, 1u);
    EXPECT_EQ(store.count_unused_one_time_pre_keys("alice", soon()), 10u);
}

TEST_F(KeyIngestionTest, AcceptsUploadWithoutOneTimeKeys) {
    auto result = service.upload_keys(alice.upload("alice", 1, 0, 0), soon());
    EXPECT_EQ(result.status, UploadStatus::Accepted);
    EXPECT_EQ(result.one_time_keys_stored, 0u);
    EXPECT_TRUE(store.get_latest_signed_pre_key("alice", soon()).has_value());
}

TEST_F(KeyIngestionTest, InvalidSignatureStoresNothing) {
    double rejected_before = MetricsRegistry::instance().get_counter("keys_upload_rejected_total");

    auto upload = alice.upload("alice", 1, 1, 5);
    upload.signed_pre_key.signature[0] ^= 0x01;

    auto result = service.upload_keys(upload, soon());
    EXPECT_EQ(result.status, UploadStatus::InvalidSignature);

    EXPECT_FALSE(store.get_identity_key("alice", soon()).has_value());
    EXPECT_FALSE(store.get_latest_signed_pre_key("alice", soon()).has_value());
    EXPECT_EQ(store.count_unused_one_time_pre_keys("alice", soon()), 0u);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("keys_upload_rejected_total"), rejected_before + 1);
}

TEST_F(KeyIngestionTest, InvalidSignatureKeepsPreviousKeys) {
    auto original = alice.upload("alice", 1, 1, 3);
    ASSERT_EQ(service.upload_keys(original, soon()).status, UploadStatus::Accepted);

    TestIdentity reinstalled;
    auto forged = reinstalled.upload("alice", 2, 100, 5);
    forged.signed_pre_key.signature[5] ^= 0x80;
    EXPECT_EQ(service.upload_keys(forged, soon()).status, UploadStatus::InvalidSignature);

    EXPECT_EQ(store.get_identity_key("alice", soon())->public_key, alice.public_key());
    EXPECT_EQ(store.get_latest_signed_pre_key("alice", soon())->key_id, 1u);
    EXPECT_EQ(store.count_unused_one_time_pre_keys("alice", soon()), 3u);

    BundleAssemblyService bundles(store);
    auto bundle = bundles.get_bundle("alice", soon());
    ASSERT_EQ(bundle.status, BundleStatus::Found);
    EXPECT_EQ(bundle.bundle->identity_key.public_key, alice.public_key());
    EXPECT_EQ(bundle.bundle->signed_pre_key.key_id, 1u);
    EXPECT_EQ(bundle.bundle->signed_pre_key.public_key, original.signed_pre_key.public_key);
    EXPECT_EQ(bundle.bundle->one_time_pre_key->key_id, 1u);
}

TEST_F(KeyIngestionTest, SignatureFromAnotherIdentityIsRejected) {
    TestIdentity mallory;
    auto upload = alice.upload("alice", 1, 1, 1);
    upload.signed_pre_key.signature = mallory.sign(upload.signed_pre_key.public_key);

    EXPECT_EQ(service.upload_keys(upload, soon()).status, UploadStatus::InvalidSignature);
}

TEST_F(KeyIngestionTest, SignatureOverAnotherPreKeyIsRejected) {
    auto upload = alice.upload("alice", 1, 1, 1);
    upload.signed_pre_key.signature = alice.sign(random_bytes(kPreKeySize));

    EXPECT_EQ(service.upload_keys(upload, soon()).status, UploadStatus::InvalidSignature);
}

TEST_F(KeyIngestionTest, WrongKeyLengthsAreInvalidKeys) {
    auto short_identity = alice.upload("alice", 1, 1, 1);
    short_identity.identity_key.pop_back();
    EXPECT_EQ(service.upload_keys(short_identity, soon()).status, UploadStatus::InvalidKey);

    auto long_spk = alice.upload("alice", 1, 1, 1);
    long_spk.signed_pre_key.public_key.push_back(0);
    EXPECT_EQ(service.upload_keys(long_spk, soon()).status, UploadStatus::InvalidKey);

    auto short_sig = alice.upload("alice", 1, 1, 1);
    short_sig.signed_pre_key.signature.resize(63);
    EXPECT_EQ(service.upload_keys(short_sig, soon()).status, UploadStatus::InvalidKey);

    auto bad_otk = alice.upload("alice", 1, 1, 3);
    bad_otk.one_time_pre_keys[2].public_key.resize(16);
    auto result = service.upload_keys(bad_otk, soon());
    EXPECT_EQ(result.status, UploadStatus::InvalidKey);
    EXPECT_FALSE(result.detail.empty());

    EXPECT_FALSE(store.get_identity_key("alice", soon()).has_value());
}

TEST_F(KeyIngestionTest, OversizedBatchIsRejected) {
    KeyIngestionService strict(store, 5);
    EXPECT_EQ(strict.upload_keys(alice.upload("alice", 1, 1, 6), soon()).status, UploadStatus::InvalidKey);
    EXPECT_EQ(strict.upload_keys(alice.upload("alice", 1, 1, 5), soon()).status, UploadStatus::Accepted);
}

TEST_F(KeyIngestionTest, RetriedUploadIsIdempotent) {
    auto upload = alice.upload("alice", 1, 1, 4);
    EXPECT_EQ(service.upload_keys(upload, soon()).one_time_keys_stored, 4u);

    auto retry = service.upload_keys(upload, soon());
    EXPECT_EQ(retry.status, UploadStatus::Accepted);
    EXPECT_EQ(retry.one_time_keys_stored, 0u);
    EXPECT_EQ(store.count_unused_one_time_pre_keys("alice", soon()), 4u);
}

TEST_F(KeyIngestionTest, ReuploadReplacesIdentityKey) {
    service.upload_keys(alice.upload("alice", 1, 1, 1), soon());

    TestIdentity reinstalled;
    EXPECT_EQ(service.upload_keys(reinstalled.upload("alice", 2, 2, 1), soon()).status, UploadStatus::Accepted);
    EXPECT_EQ(store.get_identity_key("alice", soon())->public_key, reinstalled.public_key());
    EXPECT_EQ(store.get_latest_signed_pre_key("alice", soon())->key_id, 2u);
}

TEST_F(KeyIngestionTest, StorageFailureIsReportedAndNothingPersists) {
    BrokenMemoryKeyStore broken;
    KeyIngestionService failing(broken, 100);

    auto result = failing.upload_keys(alice.upload("alice", 1, 1, 3), soon());
    EXPECT_EQ(result.status, UploadStatus::StorageError);
    EXPECT_FALSE(broken.get_identity_key("alice", soon()).has_value());
}

TEST_F(KeyIngestionTest, ExpiredDeadlineIsStorageError) {
    auto result = service.upload_keys(alice.upload("alice", 1, 1, 3), already_expired());
    EXPECT_EQ(result.status, UploadStatus::StorageError);
    EXPECT_FALSE(store.get_identity_key("alice", soon()).has_value());
}

TEST_F(KeyIngestionTest, RotationWithoutIdentityIsUnknown) {
    KeyRotation rotation;
    rotation.user_id = "alice";
    rotation.signed_pre_key = alice.signed_pre_key(2);

    EXPECT_EQ(service.rotate_signed_pre_key(rotation, soon()).status, UploadStatus::UnknownIdentity);
}

TEST_F(KeyIngestionTest, RotationVerifiesAgainstStoredIdentity) {
    service.upload_keys(alice.upload("alice", 1, 1, 2), soon());

    TestIdentity mallory;
    KeyRotation forged;
    forged.user_id = "alice";
    forged.signed_pre_key = mallory.signed_pre_key(2);
    EXPECT_EQ(service.rotate_signed_pre_key(forged, soon()).status, UploadStatus::InvalidSignature);
    EXPECT_EQ(store.get_latest_signed_pre_key("alice", soon())->key_id, 1u);

    KeyRotation rotation;
    rotation.user_id = "alice";
    rotation.signed_pre_key = alice.signed_pre_key(2);
    rotation.one_time_pre_keys = TestIdentity::one_time_pre_keys(10, 3);

    auto result = service.rotate_signed_pre_key(rotation, soon());
    EXPECT_EQ(result.status, UploadStatus::Accepted);
    EXPECT_EQ(result.one_time_keys_stored, 3u);

    auto latest = store.get_latest_signed_pre_key("alice", soon());
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->key_id, 2u);
    EXPECT_EQ(latest->public_key, rotation.signed_pre_key.public_key);
    EXPECT_EQ(store.get_identity_key("alice", soon())->public_key, alice.public_key());
    EXPECT_EQ(store.count_unused_one_time_pre_keys("alice", soon()), 5u);
}

TEST_F(KeyIngestionTest, RotationRejectsMalformedKey) {
    service.upload_keys(alice.upload("alice", 1, 1, 1), soon());

    KeyRotation rotation;
    rotation.user_id = "alice";
    rotation.signed_pre_key = alice.signed_pre_key(2);
    rotation.signed_pre_key.public_key.resize(31);

    EXPECT_EQ(service.rotate_signed_pre_key(rotation, soon()).status, UploadStatus::InvalidKey);
}

TEST_F(KeyIngestionTest, RotationOutcomesAreCounted) {
    auto& metrics = MetricsRegistry::instance();
    service.upload_keys(alice.upload("alice", 1, 1, 1), soon());
    double rejected_before = metrics.get_counter("keys_upload_rejected_total");
    double rotated_before = metrics.get_counter("keys_rotated_total");

    KeyRotation malformed;
    malformed.user_id = "alice";
    malformed.signed_pre_key = alice.signed_pre_key(2);
    malformed.signed_pre_key.signature.pop_back();
    EXPECT_EQ(service.rotate_signed_pre_key(malformed, soon()).status, UploadStatus::InvalidKey);

    TestIdentity mallory;
    KeyRotation forged;
    forged.user_id = "alice";
    forged.signed_pre_key = mallory.signed_pre_key(2);
    EXPECT_EQ(service.rotate_signed_pre_key(forged, soon()).status, UploadStatus::InvalidSignature);

    EXPECT_EQ(metrics.get_counter("keys_upload_rejected_total"), rejected_before + 2);
    EXPECT_EQ(metrics.get_counter("keys_rotated_total"), rotated_before);

    KeyRotation rotation;
    rotation.user_id = "alice";
    rotation.signed_pre_key = alice.signed_pre_key(2);
    EXPECT_EQ(service.rotate_signed_pre_key(rotation, soon()).status, UploadStatus::Accepted);
    EXPECT_EQ(metrics.get_counter("keys_rotated_total"), rotated_before + 1);
}
