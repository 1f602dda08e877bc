#include "redis_key_store.hpp"
#include "server_config.hpp"
#include "key_codec.hpp"
#include "security_logger.hpp"
#include <openssl/sha.h>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

namespace keydir {

namespace {

// Upload / rotation commit.
// KEYS: ik, spk, spk_idx, spk_seq, otk, otk_free
// ARGV: write_identity, identity_key, now, spk_id, spk_pk, spk_sig, n, (otk_id, otk_pk) * n
const std::string kCommitScript = R"(
    local n = tonumber(ARGV[7])
    if n == nil or #ARGV ~= 7 + 2 * n then
        return redis.error_reply('ERR malformed key commit')
    end
    if tonumber(ARGV[4]) == nil or ARGV[5] == '' or ARGV[6] == '' then
        return redis.error_reply('ERR malformed signed pre-key')
    end
    for i = 0, n - 1 do
        if tonumber(ARGV[8 + 2 * i]) == nil or ARGV[9 + 2 * i] == '' then
            return redis.error_reply('ERR malformed one-time pre-key')
        end
    end
    local now = ARGV[3]

    if ARGV[1] == '1' then
        redis.call('HSET', KEYS[1], 'public_key', ARGV[2], 'created_at', now)
    end

    local seq = redis.call('INCR', KEYS[4])
    redis.call('HSET', KEYS[2], ARGV[4], ARGV[5] .. '|' .. ARGV[6] .. '|' .. now)
    redis.call('ZADD', KEYS[3], seq, ARGV[4])

    -- Known ids (used or not) are idempotent retries
    local inserted = 0
    for i = 0, n - 1 do
        local id = ARGV[8 + 2 * i]
        if redis.call('HSETNX', KEYS[5], id, ARGV[9 + 2 * i] .. '|' .. now) == 1 then
            redis.call('RPUSH', KEYS[6], id)
            inserted = inserted + 1
        end
    end
    return inserted
)";

// KEYS: spk, spk_idx
const std::string kLatestSignedScript = R"(
    local ids = redis.call('ZREVRANGE', KEYS[2], 0, 0)
    if #ids == 0 then
        return {}
    end
    local row = redis.call('HGET', KEYS[1], ids[1])
    if not row then
        return {}
    end
    return {ids[1], row}
)";

// Pop and mark used in one step; no other claim can observe the popped id.
// An id without a row stays consumed and is reported as an error, never as
// an empty pool.
// KEYS: otk, otk_free, otk_used
const std::string kClaimScript = R"(
    local id = redis.call('LPOP', KEYS[2])
    if not id then
        return {}
    end
    redis.call('SADD', KEYS[3], id)
    local row = redis.call('HGET', KEYS[1], id)
    if not row then
        return redis.error_reply('ERR one-time pre-key ' .. id .. ' has no row')
    end
    return {id, row}
)";

std::vector<std::string> split(const std::string& row, char sep) {
    std::vector<std::string> parts;
    std::string item;
    std::stringstream ss(row);
    while (std::getline(ss, item, sep)) parts.push_back(item);
    return parts;
}

std::uint32_t parse_key_id(const std::string& s) {
    return static_cast<std::uint32_t>(std::stoul(s));
}

} // namespace

std::shared_ptr<sw::redis::Redis> make_redis_client(const ServerConfig& config) {
    sw::redis::ConnectionOptions opts(config.redis_url);
    if (!config.redis_password.empty()) opts.password = config.redis_password;
    if (!config.redis_username.empty()) opts.user = config.redis_username;
    opts.socket_timeout = std::chrono::milliseconds(config.storage_timeout_ms);
    opts.connect_timeout = std::chrono::milliseconds(config.storage_timeout_ms);

    sw::redis::ConnectionPoolOptions pool_opts;
    pool_opts.size = config.redis_pool_size;
    pool_opts.wait_timeout = std::chrono::milliseconds(config.storage_timeout_ms);

    return std::make_shared<sw::redis::Redis>(opts, pool_opts);
}

RedisKeyStore::RedisKeyStore(std::shared_ptr<sw::redis::Redis> redis, const std::string& salt)
    : redis_(std::move(redis)), server_salt_(salt) {}

void RedisKeyStore::check_deadline(Deadline deadline, const char* operation) {
    if (std::chrono::steady_clock::now() >= deadline) {
        throw StorageError(std::string(operation) + ": deadline exceeded");
    }
}

// Salted hash of the user id, wrapped in a hash tag so that all keys of one
// user map to the same cluster slot.
std::string RedisKeyStore::blind(const std::string& user_id) const {
    std::string data = user_id + server_salt_;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

    std::stringstream ss;
    ss << "{";
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    ss << "}";
    return ss.str();
}

std::size_t RedisKeyStore::commit_keys(const KeyCommit& commit, Deadline deadline) {
    check_deadline(deadline, "commit_keys");
    const std::string u = blind(commit.user_id);

    std::vector<std::string> keys = {
        "ik:" + u, "spk:" + u, "spk_idx:" + u, "spk_seq:" + u, "otk:" + u, "otk_free:" + u
    };

    std::vector<std::string> args;
    args.reserve(7 + 2 * commit.one_time_pre_keys.size());
    args.push_back(commit.identity_key ? "1" : "0");
    args.push_back(commit.identity_key ? codec::encode_base64(commit.identity_key->public_key) : "");
    args.push_back(std::to_string(unix_millis_now()));
    args.push_back(std::to_string(commit.signed_pre_key.key_id));
    args.push_back(codec::encode_base64(commit.signed_pre_key.public_key));
    args.push_back(codec::encode_base64(commit.signed_pre_key.signature));
    args.push_back(std::to_string(commit.one_time_pre_keys.size()));
    for (const auto& otk : commit.one_time_pre_keys) {
        args.push_back(std::to_string(otk.key_id));
        args.push_back(codec::encode_base64(otk.public_key));
    }

    try {
        auto inserted = redis_->eval<long long>(kCommitScript, keys.begin(), keys.end(), args.begin(), args.end());
        return static_cast<std::size_t>(inserted);
    } catch (const sw::redis::Error& e) {
        throw StorageError(std::string("commit_keys: ") + e.what());
    }
}

std::optional<IdentityKey> RedisKeyStore::get_identity_key(const std::string& user_id, Deadline deadline) {
    check_deadline(deadline, "get_identity_key");
    try {
        std::vector<sw::redis::OptionalString> fields;
        redis_->hmget("ik:" + blind(user_id), {"public_key", "created_at"}, std::back_inserter(fields));
        if (fields.size() != 2 || !fields[0]) return std::nullopt;

        IdentityKey ik;
        ik.user_id = user_id;
        ik.public_key = codec::decode_base64(*fields[0]);
        ik.created_at = fields[1] ? std::stoll(*fields[1]) : 0;
        return ik;
    } catch (const sw::redis::Error& e) {
        throw StorageError(std::string("get_identity_key: ") + e.what());
    } catch (const ValidationError& e) {
        throw StorageError(std::string("get_identity_key: corrupted row: ") + e.what());
    } catch (const std::logic_error& e) {
        throw StorageError(std::string("get_identity_key: corrupted row: ") + e.what());
    }
}

std::optional<SignedPreKey> RedisKeyStore::get_latest_signed_pre_key(const std::string& user_id, Deadline deadline) {
    check_deadline(deadline, "get_latest_signed_pre_key");
    const std::string u = blind(user_id);
    try {
        std::vector<std::string> res;
        redis_->eval(kLatestSignedScript, {"spk:" + u, "spk_idx:" + u}, {}, std::back_inserter(res));
        if (res.size() != 2) return std::nullopt;

        auto parts = split(res[1], '|');
        if (parts.size() != 3) throw ValidationError("field count");

        SignedPreKey spk;
        spk.key_id = parse_key_id(res[0]);
        spk.user_id = user_id;
        spk.public_key = codec::decode_base64(parts[0]);
        spk.signature = codec::decode_base64(parts[1]);
        spk.created_at = std::stoll(parts[2]);
        return spk;
    } catch (const sw::redis::Error& e) {
        throw StorageError(std::string("get_latest_signed_pre_key: ") + e.what());
    } catch (const ValidationError& e) {
        throw StorageError(std::string("get_latest_signed_pre_key: corrupted row: ") + e.what());
    } catch (const std::logic_error& e) {
        throw StorageError(std::string("get_latest_signed_pre_key: corrupted row: ") + e.what());
    }
}

std::optional<OneTimePreKey> RedisKeyStore::claim_one_time_pre_key(const std::string& user_id, Deadline deadline) {
    check_deadline(deadline, "claim_one_time_pre_key");
    const std::string u = blind(user_id);

    std::vector<std::string> res;
    try {
        redis_->eval(kClaimScript, {"otk:" + u, "otk_free:" + u, "otk_used:" + u}, {}, std::back_inserter(res));
    } catch (const sw::redis::ReplyError& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            user_id, std::string("One-time pre-key claim rejected: ") + e.what());
        throw StorageError(std::string("claim_one_time_pre_key: ") + e.what());
    } catch (const sw::redis::Error& e) {
        // The claim may or may not have executed; the caller must not retry.
        throw StorageError(std::string("claim_one_time_pre_key: ") + e.what());
    }
    if (res.size() != 2) return std::nullopt;

    auto parts = split(res[1], '|');
    try {
        if (parts.size() != 2) throw ValidationError("field count");
        OneTimePreKey otk;
        otk.key_id = parse_key_id(res[0]);
        otk.user_id = user_id;
        otk.public_key = codec::decode_base64(parts[0]);
        otk.used = true;
        otk.created_at = std::stoll(parts[1]);
        return otk;
    } catch (const ValidationError& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            user_id, "Claimed one-time pre-key row is corrupted and was discarded");
        throw StorageError(std::string("claim_one_time_pre_key: corrupted row: ") + e.what());
    } catch (const std::logic_error& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            user_id, "Claimed one-time pre-key row is corrupted and was discarded");
        throw StorageError(std::string("claim_one_time_pre_key: corrupted row: ") + e.what());
    }
}

std::size_t RedisKeyStore::count_unused_one_time_pre_keys(const std::string& user_id, Deadline deadline) {
    check_deadline(deadline, "count_unused_one_time_pre_keys");
    try {
        return static_cast<std::size_t>(redis_->llen("otk_free:" + blind(user_id)));
    } catch (const sw::redis::Error& e) {
        throw StorageError(std::string("count_unused_one_time_pre_keys: ") + e.what());
    }
}

bool RedisKeyStore::is_available() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        std::cerr << "[!] Redis ping failed: " << e.what() << "\n";
        return false;
    }
}

void RedisKeyStore::purge_user(const std::string& user_id) {
    const std::string u = blind(user_id);
    try {
        redis_->del({"ik:" + u, "spk:" + u, "spk_idx:" + u, "spk_seq:" + u,
                     "otk:" + u, "otk_free:" + u, "otk_used:" + u});
    } catch (const sw::redis::Error& e) {
        throw StorageError(std::string("purge_user: ") + e.what());
    }
}

} // namespace keydir
