/*
 * ClawSuite - Application Implementation
 *
 * Central application singleton managing the lifecycle of all components.
 */
#include <clawsuite/core/application.hpp>
#include <clawsuite/core/logger.hpp>
#include <clawsuite/core/utils.hpp>
#include <clawsuite/gateway/curl_ws_transport.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <curl/curl.h>

namespace clawsuite {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Gateway dashboard server\n\n"
              << "Usage: " << prog << " [options] [config.json]\n\n"
              << "Options:\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n\n"
              << "Config file format (JSON):\n"
              << "  {\n"
              << "    \"log_level\": \"info\",\n"
              << "    \"threads\": 8,\n"
              << "    \"gateway\": { \"url\": \"ws://127.0.0.1:18789\", \"token\": \"...\" },\n"
              << "    \"exec\": { \"default_command\": \"/bin/zsh\" },\n"
              << "    \"bridge\": { \"port\": 3000, \"bind\": \"127.0.0.1\", \"auth_token\": \"...\" }\n"
              << "  }\n\n"
              << "Environment:\n"
              << "  CLAWDBOT_GATEWAY_URL, CLAWDBOT_GATEWAY_TOKEN, CLAWDBOT_GATEWAY_PASSWORD\n"
              << "  override missing gateway.url / gateway.token / gateway.password\n\n"
              << "Example:\n"
              << "  " << prog << " config.json\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , exit_code_(0)
{}

bool Application::parse_args(int argc, char* argv[], const char** config_file) {
    *config_file = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        *config_file = argv[i];
    }
    return true;
}

void Application::setup_logging() {
    std::string name = config_.get_string("log_level", "info");
    Logger::instance().set_level(parse_log_level(name, LogLevel::INFO));
}

void Application::setup_gateway() {
    GatewaySettings gw = GatewaySettings::from_config(config_);
    connection_.reset(new GatewayConnection(gw, CurlWebSocketTransport::factory(), events_));
    exec_.reset(new ExecSessionManager(*connection_, ExecSettings::from_config(config_)));

    // Missing credentials is fatal for the connection only; the server keeps
    // running so they can be supplied through /api/gateway-config
    if (!connection_->start()) {
        LOG_WARN("Gateway connection not started; waiting for credentials");
    }
}

bool Application::setup_server() {
    bridge_.reset(new BrowserBridge(*connection_, *exec_, *thread_pool_,
                                    BridgeSettings::from_config(config_)));
    api_.reset(new ApiHandlers(*connection_, *exec_, ApiSettings::from_config(config_)));
    server_.reset(new DashboardServer(*api_, *bridge_));

    if (!api_->settings().auth_token.empty()) {
        LOG_INFO("API requests require a bearer token");
    }
    return server_->start();
}

bool Application::init(int argc, char* argv[]) {
    // Initialize libcurl globally (before threads start)
    curl_global_init(CURL_GLOBAL_ALL);

    const char* config_file = nullptr;
    if (!parse_args(argc, argv, &config_file)) {
        exit_code_ = 0;
        return false;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (config_file) {
        if (!config_.load_file(config_file)) {
            LOG_WARN("Failed to load config from %s, using defaults", config_file);
        } else {
            LOG_INFO("Loaded config from %s", config_file);
        }
    }

    setup_logging();

    int threads = static_cast<int>(config_.get_int("threads", 8));
    thread_pool_.reset(new ThreadPool(threads > 0 ? static_cast<size_t>(threads) : 1));

    setup_gateway();
    if (!setup_server()) {
        exit_code_ = 1;
        return false;
    }
    return true;
}

int Application::run() {
    LOG_INFO("Entering main loop");

    int cleanup_counter = 0;
    while (running_.load()) {
        bridge_->poll();
        sleep_ms(100);

        // Periodic cleanup (~10 seconds)
        if (++cleanup_counter >= 100) {
            cleanup_counter = 0;
            size_t dropped = api_->cleanup_rate_limits();
            if (dropped > 0) {
                LOG_DEBUG("Dropped %zu idle rate limit entries", dropped);
            }
        }
    }

    return exit_code_;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");

    // Browser side first, then the sessions it held, then the gateway
    if (server_) server_->stop();
    if (bridge_) bridge_->shutdown();
    if (thread_pool_) thread_pool_->shutdown();
    if (connection_) connection_->stop();

    server_.reset();
    api_.reset();
    bridge_.reset();
    exec_.reset();
    connection_.reset();
    thread_pool_.reset();

    curl_global_cleanup();

    LOG_INFO("Goodbye!");
}

} // namespace clawsuite
