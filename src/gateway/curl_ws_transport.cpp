/*
 * ClawSuite - libcurl WebSocket transport
 *
 * Uses CURLOPT_CONNECT_ONLY=2 so curl performs the HTTP upgrade and then
 * hands frame-level control to curl_ws_send()/curl_ws_recv(). Ping frames
 * are answered by libcurl itself.
 */
#include <clawsuite/gateway/curl_ws_transport.hpp>
#include <clawsuite/core/logger.hpp>
#include <clawsuite/core/utils.hpp>

#include <algorithm>
#include <poll.h>
#include <sys/socket.h>

namespace clawsuite {

// Upper bound for a single poll() so close() is noticed quickly
static const int POLL_SLICE_MS = 100;

CurlWebSocketTransport::CurlWebSocketTransport()
    : curl_(nullptr)
    , sockfd_(CURL_SOCKET_BAD)
    , closed_(true) {}

CurlWebSocketTransport::~CurlWebSocketTransport() {
    close();
    std::lock_guard<std::mutex> lock(curl_mutex_);
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

TransportFactory CurlWebSocketTransport::factory() {
    return []() {
        return std::unique_ptr<Transport>(new CurlWebSocketTransport());
    };
}

bool CurlWebSocketTransport::open(const std::string& url, int timeout_ms, std::string& error) {
    std::lock_guard<std::mutex> lock(curl_mutex_);

    if (curl_) {
        error = "transport already opened";
        return false;
    }

    curl_ = curl_easy_init();
    if (!curl_) {
        error = "curl_easy_init failed";
        return false;
    }

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "clawsuite/0.3");
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    // SSL verification (enabled by default)
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        error = curl_easy_strerror(res);
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
        return false;
    }

    res = curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sockfd_);
    if (res != CURLE_OK || sockfd_ == CURL_SOCKET_BAD) {
        error = "no active socket after WebSocket upgrade";
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
        return false;
    }

    closed_ = false;
    LOG_DEBUG("WebSocket upgrade to %s complete", url.c_str());
    return true;
}

bool CurlWebSocketTransport::wait_socket(short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sockfd_;
    pfd.events = events;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, timeout_ms);
    return rc > 0;
}

bool CurlWebSocketTransport::send_text(const std::string& data) {
    if (closed_) return false;

    std::lock_guard<std::mutex> lock(curl_mutex_);
    if (!curl_) return false;

    size_t offset = 0;
    int64_t deadline = monotonic_ms() + 10000;

    do {
        size_t sent = 0;
        CURLcode res = curl_ws_send(curl_, data.data() + offset, data.size() - offset,
                                    &sent, 0, CURLWS_TEXT);
        if (res == CURLE_OK && (sent > 0 || data.empty())) {
            offset += sent;
            continue;
        }
        if (res == CURLE_OK || res == CURLE_AGAIN) {
            if (closed_ || monotonic_ms() > deadline) {
                LOG_WARN("WebSocket send stalled, giving up");
                return false;
            }
            wait_socket(POLLOUT, POLL_SLICE_MS);
            continue;
        }
        LOG_WARN("WebSocket send failed: %s", curl_easy_strerror(res));
        closed_ = true;
        return false;
    } while (offset < data.size());
    return true;
}

bool CurlWebSocketTransport::drain_locked() {
    char buffer[16384];

    for (;;) {
        size_t received = 0;
        const struct curl_ws_frame* meta = nullptr;
        CURLcode res = curl_ws_recv(curl_, buffer, sizeof(buffer), &received, &meta);

        if (res == CURLE_AGAIN) {
            return true;
        }
        if (res != CURLE_OK) {
            if (res != CURLE_GOT_NOTHING) {
                LOG_WARN("WebSocket receive failed: %s", curl_easy_strerror(res));
            }
            return false;
        }
        if (!meta) {
            continue;
        }
        if (meta->flags & CURLWS_CLOSE) {
            LOG_DEBUG("WebSocket close frame received");
            return false;
        }
        if (meta->flags & (CURLWS_PING | CURLWS_PONG)) {
            continue;
        }

        partial_.append(buffer, received);
        if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
            inbox_.push_back(std::string());
            inbox_.back().swap(partial_);
        }
    }
}

RecvStatus CurlWebSocketTransport::receive(std::string& out, int timeout_ms) {
    int64_t deadline = monotonic_ms() + std::max(timeout_ms, 0);

    for (;;) {
        {
            std::lock_guard<std::mutex> lock(curl_mutex_);
            if (!inbox_.empty()) {
                out.swap(inbox_.front());
                inbox_.pop_front();
                return RecvStatus::MESSAGE;
            }
            if (closed_ || !curl_) {
                return RecvStatus::CLOSED;
            }
            if (!drain_locked()) {
                closed_ = true;
            }
            if (!inbox_.empty()) {
                out.swap(inbox_.front());
                inbox_.pop_front();
                return RecvStatus::MESSAGE;
            }
            if (closed_) {
                return RecvStatus::CLOSED;
            }
        }

        int64_t remaining = deadline - monotonic_ms();
        if (remaining <= 0) {
            return RecvStatus::TIMEOUT;
        }
        wait_socket(POLLIN, static_cast<int>(std::min<int64_t>(remaining, POLL_SLICE_MS)));
    }
}

void CurlWebSocketTransport::close() {
    bool was_open = !closed_.exchange(true);
    if (!was_open) return;

    {
        std::lock_guard<std::mutex> lock(curl_mutex_);
        if (curl_) {
            size_t sent = 0;
            CURLcode res = curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
            if (res != CURLE_OK) {
                LOG_DEBUG("WebSocket close frame not sent: %s", curl_easy_strerror(res));
            }
        }
    }

    // Wakes a reader blocked in poll()
    if (sockfd_ != CURL_SOCKET_BAD) {
        ::shutdown(sockfd_, SHUT_RDWR);
    }
}

} // namespace clawsuite
