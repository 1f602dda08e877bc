#include "handlers/key_handler.hpp"
#include "handlers/health_handler.hpp"
#include "input_validator.hpp"
#include "security_logger.hpp"

namespace keydir {

std::string query_param(const std::string& target, const std::string& name) {
    size_t q = target.find('?');
    if (q == std::string::npos) return "";

    std::string query = target.substr(q + 1);
    std::string needle = name + "=";
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (pair.rfind(needle, 0) == 0) return pair.substr(needle.size());
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return "";
}

std::optional<std::string> KeyHandler::caller_id(const http::request<http::string_body>& req) const {
    auto it = req.find(config_.identity_header);
    if (it == req.end()) return std::nullopt;
    std::string id(it->value());
    if (!InputValidator::is_valid_user_id(id)) return std::nullopt;
    return id;
}

Deadline KeyHandler::request_deadline() const {
    return deadline_after(std::chrono::milliseconds(config_.request_timeout_ms));
}

http::response<http::string_body> KeyHandler::json_response(http::status status, const json::object& body, unsigned version) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(body);
    res.prepare_payload();
    add_security_headers(res);
    return res;
}

http::response<http::string_body> KeyHandler::error_response(http::status status, const std::string& code, unsigned version) {
    json::object error;
    error["error"] = code;
    return json_response(status, error, version);
}

http::response<http::string_body> KeyHandler::upload_result_response(const UploadResult& result, http::status success, unsigned version) {
    switch (result.status) {
        case UploadStatus::Accepted: {
            json::object ok;
            ok["status"] = "ok";
            ok["one_time_keys"] = result.one_time_keys_stored;
            return json_response(success, ok, version);
        }
        case UploadStatus::InvalidKey: {
            json::object error;
            error["error"] = "invalid_key";
            error["detail"] = result.detail;
            return json_response(http::status::bad_request, error, version);
        }
        case UploadStatus::InvalidSignature:
            return error_response(http::status::forbidden, "invalid_signature", version);
        case UploadStatus::UnknownIdentity:
            return error_response(http::status::not_found, "not_found", version);
        case UploadStatus::StorageError:
        default:
            return error_response(http::status::service_unavailable, "storage_error", version);
    }
}

http::response<http::string_body> KeyHandler::handle_keys_upload(const http::request<http::string_body>& req, const std::string& remote_addr) {
    auto user_id = caller_id(req);
    if (!user_id) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                            remote_addr, "Keys upload without a gateway identity");
        return error_response(http::status::unauthorized, "unauthenticated", req.version());
    }

    if (!InputValidator::is_within_size_limit(req.body().size(), config_.max_message_size)) {
        return error_response(http::status::payload_too_large, "payload_too_large", req.version());
    }

    KeyUpload upload;
    try {
        auto body = InputValidator::safe_parse_json(req.body(), config_.max_json_depth);
        upload = codec::parse_upload(body, *user_id);
    } catch (const ValidationError& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            *user_id, std::string("Keys upload: ") + e.what());
        json::object error;
        error["error"] = "invalid_key";
        error["detail"] = e.what();
        return json_response(http::status::bad_request, error, req.version());
    } catch (const boost::system::system_error&) {
        return error_response(http::status::bad_request, "invalid_request", req.version());
    }

    auto result = ingestion_.upload_keys(upload, request_deadline());
    return upload_result_response(result, http::status::created, req.version());
}

http::response<http::string_body> KeyHandler::handle_keys_rotate(const http::request<http::string_body>& req, const std::string& remote_addr) {
    auto user_id = caller_id(req);
    if (!user_id) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                            remote_addr, "Key rotation without a gateway identity");
        return error_response(http::status::unauthorized, "unauthenticated", req.version());
    }

    if (!InputValidator::is_within_size_limit(req.body().size(), config_.max_message_size)) {
        return error_response(http::status::payload_too_large, "payload_too_large", req.version());
    }

    KeyRotation rotation;
    try {
        auto body = InputValidator::safe_parse_json(req.body(), config_.max_json_depth);
        rotation = codec::parse_rotation(body, *user_id);
    } catch (const ValidationError& e) {
        json::object error;
        error["error"] = "invalid_key";
        error["detail"] = e.what();
        return json_response(http::status::bad_request, error, req.version());
    } catch (const boost::system::system_error&) {
        return error_response(http::status::bad_request, "invalid_request", req.version());
    }

    auto result = ingestion_.rotate_signed_pre_key(rotation, request_deadline());
    return upload_result_response(result, http::status::ok, req.version());
}

http::response<http::string_body> KeyHandler::handle_bundle_fetch(const http::request<http::string_body>& req, const std::string& remote_addr) {
    static const std::string prefix = "/v1/keys/bundle/";

    // Every fetch burns a one-time key, so anonymous callers are turned away
    auto caller = caller_id(req);
    if (!caller) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                            remote_addr, "Bundle fetch without a gateway identity");
        return error_response(http::status::unauthorized, "unauthenticated", req.version());
    }

    std::string target(req.target());
    size_t q = target.find('?');
    if (q != std::string::npos) target.resize(q);

    std::string target_user = target.size() > prefix.size() ? target.substr(prefix.size()) : "";
    if (!InputValidator::is_valid_user_id(target_user)) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            remote_addr, "Bundle fetch: invalid target user id");
        return error_response(http::status::bad_request, "invalid_request", req.version());
    }

    auto result = bundles_.get_bundle(target_user, request_deadline());
    switch (result.status) {
        case BundleStatus::Found:
        case BundleStatus::Exhausted: {
            auto res = json_response(http::status::ok, codec::bundle_to_json(*result.bundle), req.version());
            if (result.status == BundleStatus::Exhausted) {
                res.set("X-PreKey-Exhausted", "1");
            }
            return res;
        }
        case BundleStatus::NotFound:
            return error_response(http::status::not_found, "not_found", req.version());
        case BundleStatus::StorageError:
        default:
            return error_response(http::status::service_unavailable, "storage_error", req.version());
    }
}

http::response<http::string_body> KeyHandler::handle_keys_count(const http::request<http::string_body>& req, const std::string& remote_addr) {
    auto user_id = caller_id(req);
    if (!user_id) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                            remote_addr, "Key count without a gateway identity");
        return error_response(http::status::unauthorized, "unauthenticated", req.version());
    }

    try {
        json::object response;
        response["remaining"] = monitor_.count_available(*user_id, request_deadline());
        return json_response(http::status::ok, response, req.version());
    } catch (const StorageError& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            *user_id, std::string("Key count failed: ") + e.what());
        return error_response(http::status::service_unavailable, "storage_error", req.version());
    }
}

http::response<http::string_body> KeyHandler::handle_replenishment_check(const http::request<http::string_body>& req, const std::string& remote_addr) {
    if (!HealthHandler::verify_admin_token(config_, req)) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::AUTH_FAILURE,
                            remote_addr, "Replenishment check without admin token");
        return error_response(http::status::not_found, "not_found", req.version());
    }

    std::string user_id = query_param(std::string(req.target()), "user");
    if (!InputValidator::is_valid_user_id(user_id)) {
        return error_response(http::status::bad_request, "invalid_request", req.version());
    }

    try {
        auto check = monitor_.check_replenishment(user_id, request_deadline());
        json::object response;
        response["remaining"] = check.remaining;
        response["signalled"] = check.signalled;
        return json_response(http::status::ok, response, req.version());
    } catch (const StorageError& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::STORAGE_FAILURE,
                            user_id, std::string("Replenishment check failed: ") + e.what());
        return error_response(http::status::service_unavailable, "storage_error", req.version());
    }
}

} // namespace keydir
