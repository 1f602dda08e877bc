#include "http_session.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"
#include <iostream>

namespace keydir {

// HTTPS session (TLS transport)
HttpSession::HttpSession(
    beast::ssl_stream<beast::tcp_stream>&& stream,
    const ServerConfig& config,
    RequestHandlers handlers
)
    : stream_(std::move(stream))
    , is_tls_(true)
    , config_(config)
    , handlers_(handlers)
{
    beast::error_code ec;
    auto& s = std::get<beast::ssl_stream<beast::tcp_stream>>(stream_);
    auto ep = beast::get_lowest_layer(s).socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

// Plaintext HTTP session (behind a terminating proxy or for local development)
HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    RequestHandlers handlers
)
    : stream_(std::move(stream))
    , is_tls_(false)
    , config_(config)
    , handlers_(handlers)
{
    beast::error_code ec;
    auto& s = std::get<beast::tcp_stream>(stream_);
    auto ep = s.socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

void HttpSession::run() {
    if (is_tls_) {
        auto self = shared_from_this();
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        // Silent closure on handshake failure
        return;
    }
    do_read();
}

void HttpSession::do_read() {
    req_ = {};

    // Idle connections are dropped after 60 seconds
    if (is_tls_) {
        beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).expires_after(
            std::chrono::seconds(60));
    } else {
        std::get<beast::tcp_stream>(stream_).expires_after(std::chrono::seconds(60));
    }

    auto self = shared_from_this();
    parser_.emplace();
    parser_->body_limit(config_.max_message_size);

    if (is_tls_) {
        http::async_read(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    } else {
        http::async_read(
            std::get<beast::tcp_stream>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::body_limit) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                            remote_addr_, "Request body exceeds limit");

        // The rest of the body is never read, so the connection closes after this reply
        http::response<http::string_body> res{http::status::payload_too_large, 11};
        res.set(http::field::content_type, "application/json");
        res.body() = R"({"error":"payload_too_large"})";
        res.keep_alive(false);
        res.prepare_payload();
        send_response(std::move(res));
        return;
    }
    if (ec) {
        return;
    }

    req_ = parser_->release();
    MetricsRegistry::instance().increment_counter("http_requests_total");
    handle_request();
}

void HttpSession::handle_request() {
    std::string target(req_.target());
    std::string path = target.substr(0, target.find('?'));
    auto method = req_.method();

    if (method == http::verb::options) {
        send_response(handle_cors_preflight());
        return;
    }

    // --- Routing Table ---
    http::response<http::string_body> res;

    if (path == "/health" && method == http::verb::get) {
        res = handlers_.health.handle_health(req_.version());
    } else if (path == "/metrics" && method == http::verb::get) {
        bool is_local = (remote_addr_ == "127.0.0.1" || remote_addr_ == "::1");
        if (is_local || HealthHandler::verify_admin_token(config_, req_)) {
            res = handlers_.health.handle_metrics(req_.version());
        } else {
            res = handle_not_found();
        }

    // Key directory APIs
    } else if (path == "/v1/keys/upload" && method == http::verb::post) {
        res = handlers_.keys.handle_keys_upload(req_, remote_addr_);
    } else if (path == "/v1/keys/rotate" && method == http::verb::post) {
        res = handlers_.keys.handle_keys_rotate(req_, remote_addr_);
    } else if (path.rfind("/v1/keys/bundle/", 0) == 0 && method == http::verb::get) {
        res = handlers_.keys.handle_bundle_fetch(req_, remote_addr_);
    } else if (path == "/v1/keys/count" && method == http::verb::get) {
        res = handlers_.keys.handle_keys_count(req_, remote_addr_);
    } else if (path == "/v1/keys/replenishment-check" && method == http::verb::post) {
        res = handlers_.keys.handle_replenishment_check(req_, remote_addr_);
    } else {
        res = handle_not_found();
    }

    res.keep_alive(req_.keep_alive());
    add_cors_headers(res);
    send_response(std::move(res));
}

http::response<http::string_body> HttpSession::handle_cors_preflight() {
    http::response<http::string_body> res{http::status::no_content, req_.version()};
    add_cors_headers(res);
    res.keep_alive(req_.keep_alive());
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HttpSession::handle_not_found() {
    json::object response;
    response["error"] = "not_found";

    http::response<http::string_body> res{http::status::not_found, req_.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(response);
    res.prepare_payload();
    return res;
}

template<class Body>
void HttpSession::add_cors_headers(http::response<Body>& res) {
    std::string origin;
    auto origin_it = req_.find(http::field::origin);
    if (origin_it != req_.end()) {
        origin = std::string(origin_it->value());
    }

    for (const auto& allowed : config_.allowed_origins) {
        if (allowed == "*" || (!origin.empty() && allowed == origin)) {
            res.set(http::field::access_control_allow_origin, allowed == "*" ? "*" : origin);
            break;
        }
    }

    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, X-Admin-Token, " + config_.identity_header);
    res.set(http::field::access_control_max_age, "86400");
    res.set(http::field::vary, "Origin");
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

    auto self = shared_from_this();

    if (is_tls_) {
        http::async_write(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    } else {
        http::async_write(
            std::get<beast::tcp_stream>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    }
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        std::cerr << "[!] HTTP write error: " << ec.message() << "\n";
        return;
    }

    if (close) {
        if (is_tls_) {
            beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).socket().shutdown(
                tcp::socket::shutdown_send, ec);
        } else {
            std::get<beast::tcp_stream>(stream_).socket().shutdown(
                tcp::socket::shutdown_send, ec);
        }
        return;
    }

    do_read();
}

} // namespace keydir
