#pragma once

#include <optional>
#include <string>

#include "key_store.hpp"

namespace keydir {

enum class BundleStatus {
    Found,        // bundle carries a freshly claimed one-time pre-key
    Exhausted,    // bundle returned without a one-time pre-key
    NotFound,     // no identity key or no signed pre-key for the target
    StorageError
};

struct BundleResult {
    BundleStatus status = BundleStatus::NotFound;
    std::optional<PreKeyBundle> bundle; // set for Found and Exhausted
};

// Assembles pre-key bundles for session initiators.
//
// A claimed one-time pre-key is consumed for good: there is no retry and no
// undo, even when the bundle never reaches the requester.
class BundleAssemblyService {
public:
    explicit BundleAssemblyService(KeyStore& store) : store_(store) {}

    BundleResult get_bundle(const std::string& target_user_id, Deadline deadline);

private:
    KeyStore& store_;
};

} // namespace keydir
