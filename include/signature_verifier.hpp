#pragma once

#include "key_types.hpp"

namespace keydir {

// Ed25519 verification of signed pre-keys against identity keys.
class SignatureVerifier {
public:
    /**
     * Verifies an Ed25519 signature over an arbitrary message.
     * Rejects keys and signatures of the wrong length without touching OpenSSL.
     */
    static bool verify_ed25519(const Bytes& pubkey, const Bytes& message, const Bytes& signature);

    // True when signed_pre_key.signature = Sign(identity_key, signed_pre_key.public_key).
    static bool verify_signed_pre_key(const Bytes& identity_key, const SignedPreKey& signed_pre_key);
};

} // namespace keydir
