/*
 * ClawSuite - Dashboard HTTP/WebSocket server
 *
 * Uses Crow (https://crowcpp.org) for HTTP and WebSocket functionality.
 */
#ifndef CLAWSUITE_HTTP_SERVER_HPP
#define CLAWSUITE_HTTP_SERVER_HPP

#include "api.hpp"
#include "../bridge/bridge.hpp"

#include <memory>

namespace clawsuite {

class CrowServer;

// Routes:
//   WS   /api/terminal-stream   terminal channel (opens or attaches on connect)
//   WS   /api/events            activity feed
//   POST /api/terminal-input, /api/terminal-resize, /api/terminal-close
//   GET  /api/gateway/status,  POST /api/gateway/reconnect
//   GET/POST /api/gateway-config
//   GET  /health
class DashboardServer {
public:
    DashboardServer(ApiHandlers& api, BrowserBridge& bridge);
    ~DashboardServer();

    DashboardServer(const DashboardServer&) = delete;
    DashboardServer& operator=(const DashboardServer&) = delete;

    bool start();
    void stop();
    bool is_running() const;

    size_t connection_count() const;

private:
    std::unique_ptr<CrowServer> impl_;
};

} // namespace clawsuite

#endif // CLAWSUITE_HTTP_SERVER_HPP
