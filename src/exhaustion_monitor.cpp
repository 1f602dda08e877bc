#include "exhaustion_monitor.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"
#include <boost/json.hpp>

namespace keydir {

bool RedisReplenishmentNotifier::notify_low_pre_keys(const std::string& user_id, std::size_t remaining_count) {
    boost::json::object event;
    event["user_id"] = user_id;
    event["remaining_count"] = remaining_count;

    try {
        redis_->publish(kChannel, boost::json::serialize(event));
        return true;
    } catch (const sw::redis::Error& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            user_id, std::string("Replenishment publish failed: ") + e.what());
        return false;
    }
}

bool LoggingReplenishmentNotifier::notify_low_pre_keys(const std::string& user_id, std::size_t remaining_count) {
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::REPLENISHMENT_SIGNAL,
                        user_id, "No push channel; " + std::to_string(remaining_count) + " one-time pre-keys left");
    return true;
}

ReplenishmentCheck ExhaustionMonitor::check_replenishment(const std::string& user_id, Deadline deadline) {
    ReplenishmentCheck check;
    check.remaining = store_.count_unused_one_time_pre_keys(user_id, deadline);

    if (check.remaining < threshold_) {
        check.signalled = notifier_.notify_low_pre_keys(user_id, check.remaining);
        if (check.signalled) {
            MetricsRegistry::instance().increment_counter("replenishment_signals_total");
            SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::REPLENISHMENT_SIGNAL,
                                user_id, std::to_string(check.remaining) + " one-time pre-keys left");
        }
    }
    return check;
}

} // namespace keydir
