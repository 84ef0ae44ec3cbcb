/*
 * Dashboard Server Implementation
 *
 * Browser-facing HTTP and WebSocket endpoints. Request handling lives in
 * ApiHandlers and BrowserBridge; this file only adapts Crow to them.
 */

#include <clawsuite/http/server.hpp>
#include <clawsuite/core/logger.hpp>
#include <clawsuite/core/utils.hpp>

// Crow (C++17 required)
#include <crow.h>

#include <atomic>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace clawsuite {

// ============================================================================
// Crow WebSocket sink
// ============================================================================

// Crow queues writes on its own I/O threads without a limit, so send_text
// never blocks; BridgeChannel caps what a silent tab can accumulate.
// detach() runs from onclose before Crow frees the connection.
class CrowSink : public BridgeSink {
public:
    explicit CrowSink(crow::websocket::connection* conn) : conn_(conn) {}

    bool send_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!conn_) return false;
        try {
            conn_->send_text(text);
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to send to WebSocket client: %s", e.what());
            return false;
        }
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (conn_) conn_->close("server shutting down");
    }

    void detach() {
        std::lock_guard<std::mutex> lock(mutex_);
        conn_ = nullptr;
    }

private:
    std::mutex mutex_;
    crow::websocket::connection* conn_;
};

// What onaccept learned from the upgrade request; handed to onopen
struct AcceptInfo {
    bool terminal;
    std::string session_id;
    Json options;

    AcceptInfo() : terminal(false), options(Json::object()) {}
};

static crow::response to_crow(const ApiResponse& r) {
    crow::response res(r.status);
    res.set_header("Content-Type", "application/json");
    res.body = r.body.dump(-1, ' ', false, Json::error_handler_t::replace);
    return res;
}

static std::string url_param(const crow::request& req, const char* name) {
    const char* value = req.url_params.get(name);
    return value ? std::string(value) : std::string();
}

// ============================================================================
// CrowServer
// ============================================================================

class CrowServer {
public:
    CrowServer(ApiHandlers& api, BrowserBridge& bridge)
        : api_(api)
        , bridge_(bridge)
        , running_(false) {
        app_.loglevel(crow::LogLevel::Warning);
        setup_routes();
    }

    ~CrowServer() {
        stop();
    }

    bool start() {
        if (running_) return true;

        const ApiSettings& s = api_.settings();
        std::string bind = s.bind.empty() ? "0.0.0.0" : s.bind;
        int port = s.port;

        running_ = true;
        server_thread_ = std::thread([this, bind, port]() {
            try {
                app_.bindaddr(bind).port(static_cast<uint16_t>(port)).multithreaded().run();
            } catch (const std::exception& e) {
                LOG_ERROR("Dashboard server error: %s", e.what());
            }
            running_ = false;
        });

        // Wait a bit for server to start
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (!running_) {
            if (server_thread_.joinable()) server_thread_.join();
            LOG_ERROR("Dashboard server failed to start on %s:%d", bind.c_str(), port);
            return false;
        }

        LOG_INFO("Dashboard server listening on %s:%d", bind.c_str(), port);
        return true;
    }

    void stop() {
        if (server_thread_.joinable()) {
            app_.stop();
            server_thread_.join();
        }
        running_ = false;

        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& entry : connections_) {
            entry.second.sink->detach();
        }
        connections_.clear();
    }

    bool is_running() const { return running_; }

    size_t connection_count() const {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        return connections_.size();
    }

private:
    struct Entry {
        ChannelId channel;
        std::shared_ptr<CrowSink> sink;

        Entry() : channel(0) {}
    };

    bool check_auth(const crow::request& req) const {
        return api_.authorized(req.get_header_value("Authorization"), url_param(req, "token"));
    }

    std::string client_of(const crow::request& req) const {
        return ApiHandlers::client_address(req.get_header_value("X-Forwarded-For"),
                                           req.get_header_value("X-Real-IP"),
                                           req.remote_ip_address);
    }

    void setup_routes() {
        CROW_ROUTE(app_, "/health")
        ([this]() {
            return to_crow(api_.health());
        });

        CROW_ROUTE(app_, "/api/terminal-input").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req) {
            if (!check_auth(req)) return to_crow(ApiResponse::error(401, "Unauthorized"));
            return to_crow(api_.terminal_input(client_of(req), req.body));
        });

        CROW_ROUTE(app_, "/api/terminal-resize").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req) {
            if (!check_auth(req)) return to_crow(ApiResponse::error(401, "Unauthorized"));
            return to_crow(api_.terminal_resize(req.body));
        });

        CROW_ROUTE(app_, "/api/terminal-close").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req) {
            if (!check_auth(req)) return to_crow(ApiResponse::error(401, "Unauthorized"));
            return to_crow(api_.terminal_close(req.body));
        });

        CROW_ROUTE(app_, "/api/gateway/status")
        ([this](const crow::request& req) {
            if (!check_auth(req)) return to_crow(ApiResponse::error(401, "Unauthorized"));
            return to_crow(api_.gateway_status());
        });

        CROW_ROUTE(app_, "/api/gateway/reconnect").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req) {
            if (!check_auth(req)) return to_crow(ApiResponse::error(401, "Unauthorized"));
            return to_crow(api_.gateway_reconnect());
        });

        CROW_ROUTE(app_, "/api/gateway-config")
            .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Post)
        ([this](const crow::request& req) {
            if (!check_auth(req)) return to_crow(ApiResponse::error(401, "Unauthorized"));
            if (req.method == crow::HTTPMethod::Post) {
                return to_crow(api_.update_gateway_config(req.body));
            }
            return to_crow(api_.gateway_config());
        });

        CROW_WEBSOCKET_ROUTE(app_, "/api/terminal-stream")
            .onaccept([this](const crow::request& req, void** userdata) {
                return on_ws_accept(req, userdata, true);
            })
            .onopen([this](crow::websocket::connection& conn) {
                on_ws_open(conn);
            })
            .onclose([this](crow::websocket::connection& conn, const std::string& reason) {
                on_ws_close(conn, reason);
            })
            .onmessage([this](crow::websocket::connection& conn, const std::string& data, bool is_binary) {
                on_ws_message(conn, data, is_binary);
            });

        CROW_WEBSOCKET_ROUTE(app_, "/api/events")
            .onaccept([this](const crow::request& req, void** userdata) {
                return on_ws_accept(req, userdata, false);
            })
            .onopen([this](crow::websocket::connection& conn) {
                on_ws_open(conn);
            })
            .onclose([this](crow::websocket::connection& conn, const std::string& reason) {
                on_ws_close(conn, reason);
            })
            .onmessage([this](crow::websocket::connection& conn, const std::string& data, bool is_binary) {
                on_ws_message(conn, data, is_binary);
            });
    }

    bool on_ws_accept(const crow::request& req, void** userdata, bool terminal) {
        if (!check_auth(req)) {
            LOG_WARN("Rejected unauthenticated WebSocket from %s", client_of(req).c_str());
            return false;
        }

        AcceptInfo* info = new AcceptInfo();
        info->terminal = terminal;
        info->session_id = url_param(req, "sessionId");

        std::string command = url_param(req, "command");
        if (!command.empty()) info->options["command"] = command;
        std::string cwd = url_param(req, "cwd");
        if (!cwd.empty()) info->options["cwd"] = cwd;
        std::string cols = url_param(req, "cols");
        if (!cols.empty()) info->options["cols"] = std::atoi(cols.c_str());
        std::string rows = url_param(req, "rows");
        if (!rows.empty()) info->options["rows"] = std::atoi(rows.c_str());

        *userdata = info;
        return true;
    }

    void on_ws_open(crow::websocket::connection& conn) {
        std::unique_ptr<AcceptInfo> info(static_cast<AcceptInfo*>(conn.userdata()));
        conn.userdata(nullptr);
        if (!info) info.reset(new AcceptInfo());

        std::shared_ptr<CrowSink> sink = std::make_shared<CrowSink>(&conn);
        std::shared_ptr<BridgeChannel> chan = bridge_.open_channel(sink);

        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            Entry entry;
            entry.channel = chan->id();
            entry.sink = sink;
            connections_[&conn] = entry;
        }

        LOG_DEBUG("WebSocket client %s connected (channel %llu)",
                  conn.get_remote_ip().c_str(), static_cast<unsigned long long>(chan->id()));

        if (!info->terminal) {
            bridge_.watch_activity(chan->id());
        } else if (!info->session_id.empty()) {
            bridge_.attach_terminal(chan->id(), info->session_id);
        } else {
            bridge_.open_terminal_async(chan->id(), BrowserBridge::parse_exec_options(info->options));
        }
    }

    void on_ws_close(crow::websocket::connection& conn, const std::string& reason) {
        Entry entry;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            auto it = connections_.find(&conn);
            if (it != connections_.end()) {
                entry = it->second;
                connections_.erase(it);
                found = true;
            }
        }

        // Accepted but never opened
        delete static_cast<AcceptInfo*>(conn.userdata());
        conn.userdata(nullptr);

        if (found) {
            entry.sink->detach();
            LOG_DEBUG("WebSocket channel %llu closed (reason: %s)",
                      static_cast<unsigned long long>(entry.channel), reason.c_str());
            bridge_.disconnect(entry.channel, "browser disconnected");
        }
    }

    void on_ws_message(crow::websocket::connection& conn, const std::string& data, bool is_binary) {
        ChannelId channel = 0;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            auto it = connections_.find(&conn);
            if (it == connections_.end()) return;
            channel = it->second.channel;
        }
        if (is_binary) {
            LOG_DEBUG("Ignoring binary WebSocket message on channel %llu",
                      static_cast<unsigned long long>(channel));
            return;
        }
        bridge_.handle_message(channel, data);
    }

    ApiHandlers& api_;
    BrowserBridge& bridge_;
    std::atomic<bool> running_;
    crow::SimpleApp app_;
    std::thread server_thread_;

    mutable std::mutex connections_mutex_;
    std::unordered_map<crow::websocket::connection*, Entry> connections_;
};

// ============================================================================
// DashboardServer
// ============================================================================

DashboardServer::DashboardServer(ApiHandlers& api, BrowserBridge& bridge)
    : impl_(new CrowServer(api, bridge)) {}

DashboardServer::~DashboardServer() {
    stop();
}

bool DashboardServer::start() {
    return impl_->start();
}

void DashboardServer::stop() {
    impl_->stop();
}

bool DashboardServer::is_running() const {
    return impl_->is_running();
}

size_t DashboardServer::connection_count() const {
    return impl_->connection_count();
}

} // namespace clawsuite
