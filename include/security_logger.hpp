#pragma once

#include <string>
#include <cctype>
#include <ctime>
#include <exception>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace keydir {

// Logs key-directory events with blinded subjects (salted hash of the user id
// or remote address). Records are single lines on stdout / stderr.
class SecurityLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        KEYS_UPLOADED,
        KEYS_ROTATED,
        INVALID_INPUT,
        INVALID_SIGNATURE,
        BUNDLE_SERVED,
        PREKEYS_EXHAUSTED,
        REPLENISHMENT_SIGNAL,
        STORAGE_FAILURE,
        AUTH_FAILURE,
        CONNECTION_REJECTED,
        LIFECYCLE
    };

    /**
     * Records an event.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param subject User id or remote address; blinded before logging.
     *                "internal" and "unknown" are written verbatim.
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& subject,
                    const std::string& message = "") {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] ";

        ss << "subject=" << blind_subject(subject, gmt);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    // Escapes quotes and control characters so a record stays on one line.
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    // The salt is random and rotated every 6 hours, so past subject-to-hash
    // mappings cannot be reversed from a later salt.
    static std::string blind_subject(const std::string& subject, const struct tm& gmt) {
        if (subject == "internal" || subject == "unknown" || subject.empty()) {
            return subject.empty() ? "unknown" : subject;
        }

        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::string salt;
        {
            std::lock_guard<std::mutex> lock(salt_mutex);
            auto now_steady = std::chrono::steady_clock::now();
            if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
                unsigned char b[32];
                if (RAND_bytes(b, 32) != 1) {
                    std::cerr << "[CRITICAL] CSPRNG failure in SecurityLogger. Terminating instance for safety.\n";
                    std::terminate();
                }
                std::stringstream salt_ss;
                for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
                log_salt = salt_ss.str();
                last_rotation = now_steady;

                std::cout << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] [INFO] [LIFECYCLE] msg=\"Log blinding salt rotated\"\n";
            }
            salt = log_salt;
        }

        std::string data = subject + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::KEYS_UPLOADED: return "KEYS_UPLOADED";
            case EventType::KEYS_ROTATED: return "KEYS_ROTATED";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::INVALID_SIGNATURE: return "INVALID_SIGNATURE";
            case EventType::BUNDLE_SERVED: return "BUNDLE_SERVED";
            case EventType::PREKEYS_EXHAUSTED: return "PREKEYS_EXHAUSTED";
            case EventType::REPLENISHMENT_SIGNAL: return "REPLENISH";
            case EventType::STORAGE_FAILURE: return "STORAGE_FAILURE";
            case EventType::AUTH_FAILURE: return "AUTH_FAILURE";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }
};

} // namespace keydir
