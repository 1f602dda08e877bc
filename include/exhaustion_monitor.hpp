#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <sw/redis++/redis++.h>

#include "key_store.hpp"

namespace keydir {

// Notification collaborator told when a user's one-time pre-key pool runs low.
// May be invoked repeatedly while the count stays low; debouncing is up to
// the implementation.
class ReplenishmentNotifier {
public:
    virtual ~ReplenishmentNotifier() = default;

    // @return true if the signal was handed off.
    virtual bool notify_low_pre_keys(const std::string& user_id, std::size_t remaining_count) = 0;
};

// Publishes {"user_id", "remaining_count"} on a Redis channel consumed by the
// push service.
class RedisReplenishmentNotifier : public ReplenishmentNotifier {
public:
    static constexpr const char* kChannel = "prekeys:replenish";

    explicit RedisReplenishmentNotifier(std::shared_ptr<sw::redis::Redis> redis)
        : redis_(std::move(redis)) {}

    bool notify_low_pre_keys(const std::string& user_id, std::size_t remaining_count) override;

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};

// Used with the in-process store, where no push service is attached: the
// signal only goes to the security log.
class LoggingReplenishmentNotifier : public ReplenishmentNotifier {
public:
    bool notify_low_pre_keys(const std::string& user_id, std::size_t remaining_count) override;
};

struct ReplenishmentCheck {
    std::size_t remaining = 0;
    bool signalled = false;
};

// Read-only, stateless check driven by an external scheduler.
class ExhaustionMonitor {
public:
    ExhaustionMonitor(KeyStore& store, ReplenishmentNotifier& notifier, std::size_t threshold)
        : store_(store), notifier_(notifier), threshold_(threshold) {}

    /**
     * Counts the user's unused one-time pre-keys and signals the notifier when
     * the count is below the threshold.
     * @throws StorageError if the count cannot be read.
     */
    ReplenishmentCheck check_replenishment(const std::string& user_id, Deadline deadline);

    // Unused one-time pre-keys left for the user.
    std::size_t count_available(const std::string& user_id, Deadline deadline) {
        return store_.count_unused_one_time_pre_keys(user_id, deadline);
    }

    std::size_t threshold() const { return threshold_; }

private:
    KeyStore& store_;
    ReplenishmentNotifier& notifier_;
    std::size_t threshold_;
};

} // namespace keydir
