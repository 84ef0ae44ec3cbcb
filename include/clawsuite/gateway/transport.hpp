#ifndef CLAWSUITE_GATEWAY_TRANSPORT_HPP
#define CLAWSUITE_GATEWAY_TRANSPORT_HPP

#include <functional>
#include <memory>
#include <string>

namespace clawsuite {

enum class RecvStatus {
    MESSAGE,
    TIMEOUT,
    CLOSED
};

// A message-oriented connection to the gateway. One instance lives for one
// connection generation; reconnecting builds a fresh one from the factory.
// send_text() may be called from any thread; receive() is called from a
// single reader thread; close() may be called concurrently with both and
// must make receive() return CLOSED promptly.
class Transport {
public:
    virtual ~Transport() {}

    virtual bool open(const std::string& url, int timeout_ms, std::string& error) = 0;
    virtual bool send_text(const std::string& data) = 0;
    virtual RecvStatus receive(std::string& out, int timeout_ms) = 0;
    virtual void close() = 0;
};

typedef std::function<std::unique_ptr<Transport>()> TransportFactory;

} // namespace clawsuite

#endif // CLAWSUITE_GATEWAY_TRANSPORT_HPP
