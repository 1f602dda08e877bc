#include "bundle_assembly_service.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"

namespace keydir {

BundleResult BundleAssemblyService::get_bundle(const std::string& target_user_id, Deadline deadline) {
    BundleResult result;
    auto& metrics = MetricsRegistry::instance();
    metrics.increment_counter("bundle_fetch_total");

    try {
        auto identity = store_.get_identity_key(target_user_id, deadline);
        if (!identity) {
            result.status = BundleStatus::NotFound;
            return result;
        }

        // Identity without a signed pre-key is not reachable yet.
        auto signed_pre_key = store_.get_latest_signed_pre_key(target_user_id, deadline);
        if (!signed_pre_key) {
            result.status = BundleStatus::NotFound;
            return result;
        }

        PreKeyBundle bundle;
        bundle.user_id = target_user_id;
        bundle.identity_key = std::move(*identity);
        bundle.signed_pre_key = std::move(*signed_pre_key);
        bundle.one_time_pre_key = store_.claim_one_time_pre_key(target_user_id, deadline);

        if (bundle.one_time_pre_key) {
            metrics.increment_counter("prekeys_claimed_total");
            SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::BUNDLE_SERVED,
                                target_user_id, "Claimed one-time pre-key " + std::to_string(bundle.one_time_pre_key->key_id));
            result.status = BundleStatus::Found;
        } else {
            metrics.increment_counter("bundle_exhausted_total");
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::PREKEYS_EXHAUSTED,
                                target_user_id, "Serving bundle without a one-time pre-key");
            result.status = BundleStatus::Exhausted;
        }
        result.bundle = std::move(bundle);
        return result;
    } catch (const StorageError& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            target_user_id, std::string("Bundle assembly failed: ") + e.what());
        metrics.increment_counter("storage_errors_total");
        result.status = BundleStatus::StorageError;
        result.bundle.reset();
        return result;
    }
}

} // namespace keydir
