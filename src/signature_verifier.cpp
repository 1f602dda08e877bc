#include "signature_verifier.hpp"
#include <openssl/evp.h>

namespace keydir {

bool SignatureVerifier::verify_ed25519(const Bytes& pubkey, const Bytes& message, const Bytes& signature) {
    if (pubkey.size() != kIdentityKeySize || signature.size() != kSignatureSize) return false;

    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, NULL, pubkey.data(), pubkey.size());
    if (!pkey) return false;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    bool result = false;

    if (ctx && EVP_DigestVerifyInit(ctx, NULL, NULL, NULL, pkey) == 1) {
        if (EVP_DigestVerify(ctx, signature.data(), signature.size(), message.data(), message.size()) == 1) {
            result = true;
        }
    }

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return result;
}

bool SignatureVerifier::verify_signed_pre_key(const Bytes& identity_key, const SignedPreKey& signed_pre_key) {
    if (signed_pre_key.public_key.size() != kPreKeySize) return false;
    return verify_ed25519(identity_key, signed_pre_key.public_key, signed_pre_key.signature);
}

} // namespace keydir
