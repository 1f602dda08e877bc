#pragma once

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "key_types.hpp"
#include "key_codec.hpp"

namespace keydir {
namespace testing_support {

inline Bytes random_bytes(std::size_t n) {
    Bytes out(n);
    if (RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

// A client-side Ed25519 identity that signs its own pre-keys.
class TestIdentity {
public:
    TestIdentity() : key_(nullptr, &EVP_PKEY_free) {
        EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
        EVP_PKEY* raw = nullptr;
        if (!ctx || EVP_PKEY_keygen_init(ctx) != 1 || EVP_PKEY_keygen(ctx, &raw) != 1) {
            EVP_PKEY_CTX_free(ctx);
            throw std::runtime_error("Ed25519 keygen failed");
        }
        EVP_PKEY_CTX_free(ctx);
        key_.reset(raw);

        std::size_t len = kIdentityKeySize;
        public_key_.resize(len);
        if (EVP_PKEY_get_raw_public_key(raw, public_key_.data(), &len) != 1) {
            throw std::runtime_error("Ed25519 public key export failed");
        }
    }

    const Bytes& public_key() const { return public_key_; }

    Bytes sign(const Bytes& message) const {
        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        Bytes sig(kSignatureSize);
        std::size_t len = sig.size();
        bool ok = ctx
            && EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, key_.get()) == 1
            && EVP_DigestSign(ctx, sig.data(), &len, message.data(), message.size()) == 1;
        EVP_MD_CTX_free(ctx);
        if (!ok) throw std::runtime_error("Ed25519 sign failed");
        return sig;
    }

    SignedPreKey signed_pre_key(std::uint32_t key_id) const {
        SignedPreKey spk;
        spk.key_id = key_id;
        spk.public_key = random_bytes(kPreKeySize);
        spk.signature = sign(spk.public_key);
        return spk;
    }

    static std::vector<OneTimePreKey> one_time_pre_keys(std::uint32_t first_id, std::size_t count) {
        std::vector<OneTimePreKey> keys;
        for (std::size_t i = 0; i < count; ++i) {
            OneTimePreKey otk;
            otk.key_id = first_id + static_cast<std::uint32_t>(i);
            otk.public_key = random_bytes(kPreKeySize);
            keys.push_back(otk);
        }
        return keys;
    }

    KeyUpload upload(const std::string& user_id, std::uint32_t spk_id,
                     std::uint32_t first_otk_id, std::size_t otk_count) const {
        KeyUpload upload;
        upload.user_id = user_id;
        upload.identity_key = public_key_;
        upload.signed_pre_key = signed_pre_key(spk_id);
        upload.signed_pre_key.user_id = user_id;
        upload.one_time_pre_keys = one_time_pre_keys(first_otk_id, otk_count);
        for (auto& otk : upload.one_time_pre_keys) otk.user_id = user_id;
        return upload;
    }

    KeyCommit commit(const KeyUpload& upload) const {
        KeyCommit commit;
        commit.user_id = upload.user_id;
        IdentityKey ik;
        ik.user_id = upload.user_id;
        ik.public_key = upload.identity_key;
        commit.identity_key = ik;
        commit.signed_pre_key = upload.signed_pre_key;
        commit.one_time_pre_keys = upload.one_time_pre_keys;
        return commit;
    }

private:
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
    Bytes public_key_;
};

// Captures std::cout for the lifetime of the object.
class StdoutCapture {
public:
    StdoutCapture() : old_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~StdoutCapture() { std::cout.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }

private:
    std::stringstream buffer_;
    std::streambuf* old_;
};

inline Deadline soon() {
    return deadline_after(std::chrono::milliseconds(2000));
}

inline Deadline already_expired() {
    return std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
}

} // namespace testing_support
} // namespace keydir
