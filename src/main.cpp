#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <filesystem>
#include <stdexcept>

#include "server_config.hpp"
#include "key_store.hpp"
#include "memory_key_store.hpp"
#include "redis_key_store.hpp"
#include "key_ingestion_service.hpp"
#include "bundle_assembly_service.hpp"
#include "exhaustion_monitor.hpp"
#include "http_session.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace keydir {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        RequestHandlers handlers
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , handlers_(handlers)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    RequestHandlers handlers_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            // Acceptor closed by shutdown
            return;
        }

        if (ec) {
            SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONNECTION_REJECTED, "internal", "Accept error: " + ec.message());
        } else if (config_.enable_tls) {
            auto stream = beast::ssl_stream<beast::tcp_stream>(
                beast::tcp_stream(std::move(socket)),
                ssl_ctx_
            );

            std::make_shared<HttpSession>(
                std::move(stream),
                config_,
                handlers_
            )->run();
        } else {
            std::make_shared<HttpSession>(
                beast::tcp_stream(std::move(socket)),
                config_,
                handlers_
            )->run();
        }

        do_accept();
    }
};

}

// Configures the SSL context (TLS 1.2+).
void load_server_certificate(ssl::context& ctx, const std::string& cert_path, const std::string& key_path) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );

    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    SSL_CTX_set_cipher_list(ctx.native_handle(),
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256"
    );

    ctx.use_certificate_chain_file(cert_path);
    ctx.use_private_key_file(key_path, ssl::context::pem);
}

int main(int argc, char* argv[]) {
    using keydir::SecurityLogger;
    try {
        keydir::ServerConfig config;

        // --- Environment Variable Overrides ---
        keydir::apply_env_overrides(config);

        // --- CLI Argument Parsing (wins over the environment) ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--no-tls" || arg == "-n") {
                config.enable_tls = false;
            } else if (arg == "--memory-store" || arg == "-m") {
                config.use_memory_store = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [port] [options]\n"
                          << "Options:\n"
                          << "  --no-tls, -n         Disable TLS (behind a terminating proxy or for development)\n"
                          << "  --memory-store, -m   Keep keys in process memory instead of Redis\n"
                          << "  --help, -h           Show this help\n";
                return 0;
            } else {
                try {
                    config.port = static_cast<uint16_t>(std::stoi(arg));
                } catch (const std::exception&) {
                    std::cerr << "[!] Unknown argument: " << arg << "\n";
                    return 1;
                }
            }
        }

        if (config.allowed_origins.empty()) {
             SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal", "No CORS origins configured");
        }

        // The salt blinds user ids in Redis keys; a shared default would make them guessable.
        if (config.secret_salt == keydir::kDefaultSecretSalt && !config.use_memory_store) {
            std::cerr << "CRITICAL SECURITY ERROR: DEFAULT SECRET SALT DETECTED\n";
            std::cerr << "Set 'KEYDIR_SECRET_SALT' environment variable immediately!\n";
            return 1;
        }

        if (config.thread_count <= 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        std::filesystem::path exe_path;
        try {
            exe_path = std::filesystem::canonical("/proc/self/exe").parent_path();
        } catch (const std::exception& e) {
            std::cerr << "[!] Warning: Could not detect executable path via /proc/self/exe: " << e.what() << std::endl;
            exe_path = std::filesystem::current_path();
        }

        if (config.enable_tls) {
            if (config.cert_path.rfind("certs/", 0) == 0) {
                config.cert_path = (exe_path / config.cert_path).string();
                config.key_path = (exe_path / config.key_path).string();
            }

            if (!std::filesystem::exists(config.cert_path) ||
                !std::filesystem::exists(config.key_path)) {
                std::cerr << "[!] TLS certificates not found at:\n"
                          << "    " << config.cert_path << "\n"
                          << "    " << config.key_path << "\n"
                          << "[*] Set KEYDIR_TLS_CERT / KEYDIR_TLS_KEY,\n"
                          << "[*] or use --no-tls when a proxy terminates TLS.\n";
                return 1;
            }
        }

        std::cout << "KEYDIR PRE-KEY DIRECTORY\n"
                  << (config.enable_tls ? "  TLS 1.2+/1.3 encrypted transport\n"
                                        : "  TLS DISABLED\n")
                  << (config.use_memory_store ? "  In-memory key store (single process)\n"
                                              : "  Redis key store at " + config.redis_url + "\n")
                  << "\n";

        net::io_context ioc{config.thread_count};

        ssl::context ssl_ctx{ssl::context::tlsv12};
        if (config.enable_tls) {
            load_server_certificate(ssl_ctx, config.cert_path, config.key_path);
        }

        // --- Key Store Backend ---
        std::unique_ptr<keydir::KeyStore> store;
        std::unique_ptr<keydir::ReplenishmentNotifier> notifier;
        if (config.use_memory_store) {
            store = std::make_unique<keydir::MemoryKeyStore>();
            notifier = std::make_unique<keydir::LoggingReplenishmentNotifier>();
        } else {
            auto redis = keydir::make_redis_client(config);
            store = std::make_unique<keydir::RedisKeyStore>(redis, config.secret_salt);
            notifier = std::make_unique<keydir::RedisReplenishmentNotifier>(redis);
            if (!store->is_available()) {
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STORAGE_FAILURE,
                                    "internal", "Redis unreachable at startup; requests will fail until it recovers");
            }
        }

        keydir::KeyIngestionService ingestion(*store, config.max_one_time_pre_keys_per_upload);
        keydir::BundleAssemblyService bundles(*store);
        keydir::ExhaustionMonitor monitor(*store, *notifier, config.replenish_threshold);

        keydir::HealthHandler health_handler(config, *store);
        keydir::KeyHandler key_handler(config, ingestion, bundles, monitor);

        auto listener = std::make_shared<keydir::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            keydir::RequestHandlers{health_handler, key_handler}
        );
        listener->run();

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Listening on " + config.address + ":" + std::to_string(config.port));

        // Captured SIGINT and SIGTERM to perform a clean shutdown. In-flight
        // requests get a grace period; idle keep-alive sessions are then cut.
        net::steady_timer drain_timer(ioc);
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, &drain_timer, listener](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal", "Initiating graceful shutdown");
                listener->stop();
                drain_timer.expires_after(std::chrono::seconds(5));
                drain_timer.async_wait([&ioc](beast::error_code const&) {
                    ioc.stop();
                });
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal", "Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
