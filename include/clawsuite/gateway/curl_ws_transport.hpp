#ifndef CLAWSUITE_GATEWAY_CURL_WS_TRANSPORT_HPP
#define CLAWSUITE_GATEWAY_CURL_WS_TRANSPORT_HPP

#include "transport.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <curl/curl.h>

namespace clawsuite {

// WebSocket client over libcurl's connect-only WebSocket API (ws:// and wss://).
// curl_global_init() must have been called before the first open().
class CurlWebSocketTransport : public Transport {
public:
    CurlWebSocketTransport();
    virtual ~CurlWebSocketTransport();

    virtual bool open(const std::string& url, int timeout_ms, std::string& error);
    virtual bool send_text(const std::string& data);
    virtual RecvStatus receive(std::string& out, int timeout_ms);
    virtual void close();

    static TransportFactory factory();

private:
    // Pull every frame libcurl has buffered; false once the peer is gone
    bool drain_locked();
    bool wait_socket(short events, int timeout_ms);

    CURL* curl_;
    curl_socket_t sockfd_;
    std::mutex curl_mutex_;          // libcurl handles are not thread-safe
    std::atomic<bool> closed_;
    std::string partial_;            // fragments of the message in progress
    std::deque<std::string> inbox_;  // complete messages not yet returned
};

} // namespace clawsuite

#endif // CLAWSUITE_GATEWAY_CURL_WS_TRANSPORT_HPP
