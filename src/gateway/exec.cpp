#include <clawsuite/gateway/exec.hpp>
#include <clawsuite/core/logger.hpp>
#include <clawsuite/core/utils.hpp>

#include <chrono>

namespace clawsuite {

static const char* const EXEC_METHOD = "exec";
static const char* const WRITE_METHOD = "exec.write";
static const char* const RESIZE_METHOD = "exec.resize";
static const char* const CLOSE_METHOD = "exec.close";

static const char* const FEED_PREFIX = "exec:";

const char* exec_state_str(ExecState state) {
    switch (state) {
        case ExecState::CREATING: return "creating";
        case ExecState::READY:    return "ready";
        case ExecState::CLOSING:  return "closing";
        case ExecState::CLOSED:   return "closed";
    }
    return "unknown";
}

ExecSettings ExecSettings::from_config(const Config& cfg) {
    ExecSettings s;
    s.create_timeout_ms = static_cast<int>(cfg.get_int("exec.create_timeout_ms", s.create_timeout_ms));
    s.write_timeout_ms = static_cast<int>(cfg.get_int("exec.write_timeout_ms", s.write_timeout_ms));
    s.close_timeout_ms = static_cast<int>(cfg.get_int("exec.close_timeout_ms", s.close_timeout_ms));
    s.default_command = cfg.get_string("exec.default_command", s.default_command);
    return s;
}

Json ExecOptions::to_params() const {
    Json params = Json::object();
    params["command"] = command;
    if (!cwd.empty()) params["cwd"] = cwd;
    if (!env.empty()) {
        Json e = Json::object();
        for (std::map<std::string, std::string>::const_iterator it = env.begin();
             it != env.end(); ++it) {
            e[it->first] = it->second;
        }
        params["env"] = e;
    }
    params["pty"] = pty;
    if (cols > 0) params["cols"] = cols;
    if (rows > 0) params["rows"] = rows;
    params["timeoutMs"] = 0;
    return params;
}

Json ExecSession::to_json() const {
    Json j = Json::object();
    j["sessionId"] = id;
    j["execId"] = exec_id.empty() ? Json() : Json(exec_id);
    j["createdAt"] = created_at;
    j["state"] = exec_state_str(state);
    return j;
}

// ============================================================================
// Static helpers
// ============================================================================

const std::vector<std::string>& ExecSessionManager::exec_id_fields() {
    static const std::vector<std::string> fields = {
        "execId", "execID", "id", "streamId", "streamID", "processId", "pid"
    };
    return fields;
}

std::string ExecSessionManager::pick_exec_id(const Json& payload) {
    if (!payload.is_object()) return "";

    const std::vector<std::string>& fields = exec_id_fields();
    for (size_t i = 0; i < fields.size(); ++i) {
        Json::const_iterator it = payload.find(fields[i]);
        if (it == payload.end() || it->is_null()) continue;
        if (it->is_string()) {
            std::string value = it->get<std::string>();
            if (!value.empty()) return value;
        } else if (it->is_number_integer()) {
            return it->dump();
        }
    }
    return "";
}

std::string ExecSessionManager::topic_for(const std::string& session_id) {
    return FEED_PREFIX + session_id;
}

// ============================================================================
// Lifecycle
// ============================================================================

ExecSessionManager::ExecSessionManager(GatewayConnection& connection, const ExecSettings& settings)
    : connection_(connection)
    , bus_(connection.events())
    , settings_(settings) {
    event_sub_ = bus_.subscribe(EventBus::WILDCARD,
        [this](const std::string& topic, const Json& payload) {
            on_gateway_event(topic, payload);
        });
    status_sub_ = bus_.subscribe(GatewayConnection::STATUS_TOPIC,
        [this](const std::string&, const Json& status) {
            on_status(status);
        });
}

ExecSessionManager::~ExecSessionManager() {
    bus_.unsubscribe(event_sub_);
    bus_.unsubscribe(status_sub_);
}

ExecSession ExecSessionManager::prepare(const ExecOptions& options) {
    RecordPtr rec = std::make_shared<Record>();
    rec->options = options;
    if (rec->options.command.empty()) {
        rec->options.command.push_back(settings_.default_command);
    }
    rec->info.id = generate_uuid();
    rec->info.created_at = current_timestamp_ms();
    rec->info.state = ExecState::CREATING;

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[rec->info.id] = rec;
    return rec->info;
}

ExecResult ExecSessionManager::start(const std::string& session_id, int timeout_ms) {
    Json params;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, RecordPtr>::iterator it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return ExecResult::fail(GatewayErrorCode::SESSION_CLOSED, "unknown exec session");
        }
        Record& rec = *it->second;
        if (rec.create_in_flight) {
            return ExecResult::fail(GatewayErrorCode::INVALID_ARGUMENT,
                                    "exec session is already being created", rec.info);
        }
        if (rec.info.state != ExecState::CREATING) {
            return ExecResult::fail(GatewayErrorCode::INVALID_ARGUMENT,
                                    "exec session was already started", rec.info);
        }
        rec.create_in_flight = true;
        params = rec.options.to_params();
    }

    if (timeout_ms < 0) timeout_ms = settings_.create_timeout_ms;
    RpcResult reply = connection_.call(EXEC_METHOD, params, timeout_ms);
    std::string exec_id = reply.ok ? pick_exec_id(reply.result) : "";

    ExecSession snapshot;
    bool survived = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, RecordPtr>::iterator it = sessions_.find(session_id);
        if (it != sessions_.end() && it->second->info.state == ExecState::CREATING) {
            RecordPtr rec = it->second;
            rec->create_in_flight = false;
            if (reply.ok && !exec_id.empty()) {
                rec->info.exec_id = exec_id;
                rec->info.state = ExecState::READY;
                by_exec_id_[exec_id] = session_id;
            } else {
                // finish() below removes it and tells the feed
                rec->info.state = ExecState::CLOSED;
            }
            snapshot = rec->info;
            survived = true;
        }
    }

    if (!survived) {
        // Closed or invalidated while the request was out
        if (!exec_id.empty()) {
            Json close_params = Json::object();
            close_params["id"] = exec_id;
            connection_.call_async(CLOSE_METHOD, close_params, settings_.close_timeout_ms);
        }
        snapshot.id = session_id;
        snapshot.state = ExecState::CLOSED;
        if (!reply.ok) {
            return ExecResult::fail(reply.code, reply.error, snapshot, reply.error_payload);
        }
        return ExecResult::fail(GatewayErrorCode::SESSION_CLOSED,
                                "exec session closed while it was being created", snapshot);
    }

    if (!reply.ok) {
        LOG_WARN("Exec session %s failed to start: %s", session_id.c_str(), reply.error.c_str());
        Json err = Json::object();
        err["message"] = reply.error;
        emit(session_id, "error", err);
        finish(session_id, reply.error);
        return ExecResult::fail(reply.code, reply.error, snapshot, reply.error_payload);
    }

    if (exec_id.empty()) {
        LOG_WARN("Exec reply for session %s carried no exec id: %s",
                 session_id.c_str(), reply.result.dump().c_str());
        finish(session_id, "gateway returned no exec id");
        return ExecResult::fail(GatewayErrorCode::GATEWAY_ERROR,
                                "gateway returned no exec id", snapshot, reply.result);
    }

    LOG_INFO("Exec session %s ready (exec id %s)", session_id.c_str(), exec_id.c_str());
    return ExecResult::success(snapshot);
}

ExecResult ExecSessionManager::create(const ExecOptions& options, int timeout_ms) {
    ExecSession session = prepare(options);
    return start(session.id, timeout_ms);
}

// ============================================================================
// Operations on Ready sessions
// ============================================================================

ExecSessionManager::RecordPtr ExecSessionManager::ready_record(const std::string& session_id,
                                                               RpcResult& error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, RecordPtr>::const_iterator it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        error = RpcResult::fail(GatewayErrorCode::SESSION_CLOSED, "exec session is closed");
        return RecordPtr();
    }
    if (it->second->info.state != ExecState::READY) {
        error = RpcResult::fail(GatewayErrorCode::SESSION_NOT_READY,
                                std::string("exec session is ") +
                                exec_state_str(it->second->info.state));
        return RecordPtr();
    }
    return it->second;
}

RpcResult ExecSessionManager::write(const std::string& session_id, const std::string& data,
                                    int timeout_ms) {
    RpcResult error;
    RecordPtr rec = ready_record(session_id, error);
    if (!rec) return error;

    Json params = Json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        params["id"] = rec->info.exec_id;
        ++rec->info.pending_writers;
    }
    params["data"] = data;

    if (timeout_ms < 0) timeout_ms = settings_.write_timeout_ms;
    RpcResult result = connection_.call(WRITE_METHOD, params, timeout_ms);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        --rec->info.pending_writers;
    }
    return result;
}

std::future<RpcResult> ExecSessionManager::write_async(const std::string& session_id,
                                                       const std::string& data) {
    RpcResult error;
    RecordPtr rec = ready_record(session_id, error);
    if (!rec) {
        std::promise<RpcResult> failed;
        failed.set_value(error);
        return failed.get_future();
    }

    Json params = Json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        params["id"] = rec->info.exec_id;
    }
    params["data"] = data;
    return connection_.call_async(WRITE_METHOD, params, settings_.write_timeout_ms);
}

RpcResult ExecSessionManager::resize(const std::string& session_id, int cols, int rows) {
    if (cols <= 0 || rows <= 0) {
        return RpcResult::fail(GatewayErrorCode::INVALID_ARGUMENT, "cols and rows must be positive");
    }

    RpcResult error;
    RecordPtr rec = ready_record(session_id, error);
    if (!rec) return error;

    Json params = Json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        params["id"] = rec->info.exec_id;
    }
    params["cols"] = cols;
    params["rows"] = rows;

    std::future<RpcResult> pending = connection_.call_async(RESIZE_METHOD, params,
                                                            settings_.write_timeout_ms);
    // Only a failed send settles this early; the answer itself is ignored
    if (pending.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
        RpcResult sent = pending.get();
        if (!sent.ok) return sent;
    }
    return RpcResult::success(Json());
}

bool ExecSessionManager::close(const std::string& session_id, const std::string& reason) {
    std::string exec_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, RecordPtr>::iterator it = sessions_.find(session_id);
        if (it == sessions_.end()) return false;
        Record& rec = *it->second;
        if (rec.info.state == ExecState::CLOSING || rec.info.state == ExecState::CLOSED) {
            return false;
        }
        rec.info.state = ExecState::CLOSING;
        exec_id = rec.info.exec_id;
    }

    if (!exec_id.empty()) {
        Json params = Json::object();
        params["id"] = exec_id;
        RpcResult r = connection_.call(CLOSE_METHOD, params, settings_.close_timeout_ms);
        if (!r.ok) {
            LOG_DEBUG("exec.close for %s ignored: %s", exec_id.c_str(), r.error.c_str());
        }
    }

    finish(session_id, reason);
    LOG_INFO("Exec session %s closed (%s)", session_id.c_str(), reason.c_str());
    return true;
}

size_t ExecSessionManager::invalidate_all(const std::string& reason) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::map<std::string, RecordPtr>::iterator it = sessions_.begin();
             it != sessions_.end(); ++it) {
            ids.push_back(it->first);
        }
    }

    for (size_t i = 0; i < ids.size(); ++i) {
        finish(ids[i], reason);
    }
    if (!ids.empty()) {
        LOG_WARN("Closed %zu exec session(s): %s", ids.size(), reason.c_str());
    }
    return ids.size();
}

bool ExecSessionManager::get(const std::string& session_id, ExecSession& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, RecordPtr>::const_iterator it = sessions_.find(session_id);
    if (it == sessions_.end()) return false;
    out = it->second->info;
    return true;
}

size_t ExecSessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

// ============================================================================
// Feed
// ============================================================================

void ExecSessionManager::finish(const std::string& session_id, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, RecordPtr>::iterator it = sessions_.find(session_id);
        if (it == sessions_.end()) return;   // someone else already closed it
        it->second->info.state = ExecState::CLOSED;
        if (!it->second->info.exec_id.empty()) {
            by_exec_id_.erase(it->second->info.exec_id);
        }
        sessions_.erase(it);
    }

    Json data = Json::object();
    data["sessionId"] = session_id;
    data["reason"] = reason;
    emit(session_id, "close", data);
}

void ExecSessionManager::emit(const std::string& session_id, const std::string& type,
                              const Json& data) {
    Json message = Json::object();
    message["type"] = type;
    message["data"] = data;
    bus_.publish(topic_for(session_id), message);
}

void ExecSessionManager::on_gateway_event(const std::string& topic, const Json& payload) {
    // Our own feed topics come back through the wildcard too
    if (!starts_with(topic, "exec") || starts_with(topic, FEED_PREFIX)) return;

    std::string exec_id = pick_exec_id(payload);
    if (exec_id.empty()) return;

    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, std::string>::const_iterator it = by_exec_id_.find(exec_id);
        if (it == by_exec_id_.end()) return;
        session_id = it->second;
    }

    Json data = Json::object();
    data["event"] = topic;
    data["payload"] = payload;
    emit(session_id, "event", data);

    if (topic == "exec.exit" || topic == "exec.closed") {
        finish(session_id, "process exited");
    }
}

void ExecSessionManager::on_status(const Json& status) {
    if (json_string_field(status, "state", "") == connection_state_str(ConnectionState::CLOSED)) {
        invalidate_all("connection lost");
    }
}

} // namespace clawsuite
