#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "server_config.hpp"
#include "key_store.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace keydir {

class HealthHandler {
public:
    HealthHandler(const ServerConfig& config, KeyStore& store)
        : config_(config), store_(store) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_metrics(unsigned version);

    // Constant-time comparison against the configured admin token. Admin
    // access is disabled while no token is configured.
    static bool verify_admin_token(const ServerConfig& config, const http::request<http::string_body>& req);

private:
    const ServerConfig& config_;
    KeyStore& store_;

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("Content-Security-Policy", "default-src 'none'");
    }
};

} // namespace keydir
