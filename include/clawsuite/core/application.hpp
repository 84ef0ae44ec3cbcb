/*
 * ClawSuite - Application Class
 *
 * Central application singleton owning configuration, the gateway
 * connection, the exec session table, the browser bridge and the HTTP
 * server, plus the main loop.
 */
#ifndef CLAWSUITE_CORE_APPLICATION_HPP
#define CLAWSUITE_CORE_APPLICATION_HPP

#include "config.hpp"
#include "thread_pool.hpp"
#include "../gateway/connection.hpp"
#include "../gateway/event_bus.hpp"
#include "../gateway/exec.hpp"
#include "../bridge/bridge.hpp"
#include "../http/api.hpp"
#include "../http/server.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace clawsuite {

struct AppInfo {
    static constexpr const char* VERSION = "0.3.0";
    static constexpr const char* NAME = "ClawSuite";
};

class Application {
public:
    static Application& instance();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // ==================== Accessors ====================

    Config& config() { return config_; }
    const Config& config() const { return config_; }

    EventBus& events() { return events_; }
    ThreadPool& thread_pool() { return *thread_pool_; }
    GatewayConnection& connection() { return *connection_; }
    ExecSessionManager& exec() { return *exec_; }
    BrowserBridge& bridge() { return *bridge_; }

    // ==================== Lifecycle ====================

    bool is_running() const { return running_.load(); }
    void stop() { running_.store(false); }

    // False for --help/--version (exit_code() 0) or a fatal error (1)
    bool init(int argc, char* argv[]);
    int exit_code() const { return exit_code_; }

    int run();
    void shutdown();

private:
    Application();

    bool parse_args(int argc, char* argv[], const char** config_file);
    void setup_logging();
    void setup_gateway();
    bool setup_server();

    std::atomic<bool> running_;
    int exit_code_;

    Config config_;
    EventBus events_;
    std::unique_ptr<ThreadPool> thread_pool_;
    std::unique_ptr<GatewayConnection> connection_;
    std::unique_ptr<ExecSessionManager> exec_;
    std::unique_ptr<BrowserBridge> bridge_;
    std::unique_ptr<ApiHandlers> api_;
    std::unique_ptr<DashboardServer> server_;
};

void print_usage(const char* prog);
void print_version();

} // namespace clawsuite

#endif // CLAWSUITE_CORE_APPLICATION_HPP
