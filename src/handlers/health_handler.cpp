#include "handlers/health_handler.hpp"
#include <openssl/crypto.h>

namespace keydir {

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    bool storage_ok = store_.is_available();
    MetricsRegistry::instance().set_gauge("storage_available", storage_ok ? 1.0 : 0.0);

    json::object response;
    response["status"] = storage_ok ? "healthy" : "degraded";
    response["storage"] = storage_ok ? (config_.use_memory_store ? "memory" : "redis") : "unavailable";
    response["tls"] = config_.enable_tls;

    http::response<http::string_body> res{storage_ok ? http::status::ok : http::status::service_unavailable, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();

    add_security_headers(res);
    return res;
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    std::string body = MetricsRegistry::instance().collect_prometheus();

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();

    add_security_headers(res);
    return res;
}

bool HealthHandler::verify_admin_token(const ServerConfig& config, const http::request<http::string_body>& req) {
    if (config.admin_token.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    std::string provided_token(auth_it->value());
    if (provided_token.size() != config.admin_token.size()) return false;
    return CRYPTO_memcmp(provided_token.data(), config.admin_token.data(), provided_token.size()) == 0;
}

} // namespace keydir
