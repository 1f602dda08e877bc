#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <optional>
#include <string>
#include "server_config.hpp"
#include "key_ingestion_service.hpp"
#include "bundle_assembly_service.hpp"
#include "exhaustion_monitor.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace keydir {

// HTTP boundary of the key directory. Maps wire requests onto the services
// and their result tags onto status codes.
class KeyHandler {
public:
    KeyHandler(const ServerConfig& config,
               KeyIngestionService& ingestion,
               BundleAssemblyService& bundles,
               ExhaustionMonitor& monitor)
        : config_(config)
        , ingestion_(ingestion)
        , bundles_(bundles)
        , monitor_(monitor) {}

    http::response<http::string_body> handle_keys_upload(const http::request<http::string_body>& req, const std::string& remote_addr);
    http::response<http::string_body> handle_bundle_fetch(const http::request<http::string_body>& req, const std::string& remote_addr);
    http::response<http::string_body> handle_keys_rotate(const http::request<http::string_body>& req, const std::string& remote_addr);
    http::response<http::string_body> handle_keys_count(const http::request<http::string_body>& req, const std::string& remote_addr);

    // Admin-only trigger for the external replenishment scheduler.
    http::response<http::string_body> handle_replenishment_check(const http::request<http::string_body>& req, const std::string& remote_addr);

private:
    const ServerConfig& config_;
    KeyIngestionService& ingestion_;
    BundleAssemblyService& bundles_;
    ExhaustionMonitor& monitor_;

    // Caller id asserted by the authenticating gateway, if well-formed.
    std::optional<std::string> caller_id(const http::request<http::string_body>& req) const;
    Deadline request_deadline() const;

    http::response<http::string_body> error_response(http::status status, const std::string& code, unsigned version);
    http::response<http::string_body> json_response(http::status status, const json::object& body, unsigned version);
    http::response<http::string_body> upload_result_response(const UploadResult& result, http::status success, unsigned version);

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("Content-Security-Policy", "default-src 'none'");
        res.set(http::field::cache_control, "no-store");
    }
};

// Extracts `name` from the query string of a request target.
std::string query_param(const std::string& target, const std::string& name);

} // namespace keydir
