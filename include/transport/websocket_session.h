#pragma once

#include "transport/transport_session.h"
#include "config.h"
#include "event_loop.h"
#include <memory>
#include <vector>

namespace calcvox {
namespace transport {

class WebSocketConnection;

/**
 * @brief Live API sessions over libcurl's WebSocket support
 *
 * The TLS/WebSocket handshake runs on a short-lived thread (it blocks);
 * its outcome is posted back to the event loop, which joins the thread and
 * then owns the curl handle exclusively: the setup message, every send and
 * the non-blocking receive in poll() happen on the loop thread.
 *
 * Sends never wait for the socket. Messages the socket refuses go to a
 * small outbox flushed from poll(); audio is dropped while the outbox is
 * backed up. A frame the socket accepted only in part ends the session
 * with TransportRuntimeError (reported from the next poll()).
 *
 * Destroying the connector abandons pending handshakes, waits for their
 * threads and releases every curl handle before curl_global_cleanup().
 *
 * Requires libcurl >= 7.86 built with WebSocket support.
 */
class WebSocketConnector : public TransportConnector {
public:
    WebSocketConnector(EventLoop& loop, const SessionConfig& config);
    ~WebSocketConnector() override;

    WebSocketConnector(const WebSocketConnector&) = delete;
    WebSocketConnector& operator=(const WebSocketConnector&) = delete;

    Result<std::unique_ptr<TransportSession>> open(const SessionSetup& setup,
                                                   const std::string& api_key,
                                                   InboundHandler handler) override;

private:
    EventLoop& loop_;
    SessionConfig config_;
    std::vector<std::weak_ptr<WebSocketConnection>> connections_;
};

} // namespace transport
} // namespace calcvox
