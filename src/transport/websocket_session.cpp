#include "transport/websocket_session.h"
#include "transport/live_protocol.h"
#include "logger.h"
#include <curl/curl.h>
#include <algorithm>
#include <atomic>
#include <deque>
#include <thread>
#include <sstream>

namespace calcvox {
namespace transport {

namespace {

constexpr size_t RECV_CHUNK_BYTES = 16 * 1024;
constexpr size_t OUTBOX_MAX_MESSAGES = 32;

// curl_ws_recv() takes a const frame pointer since 8.0
#if LIBCURL_VERSION_NUM >= 0x080000
using WsFrame = const struct curl_ws_frame;
#else
using WsFrame = struct curl_ws_frame;
#endif

} // namespace

/**
 * @brief One WebSocket connection shared by the handshake thread and the loop
 *
 * Phases: Handshaking (curl handle belongs to the handshake thread) ->
 * AwaitingSetup -> Open -> Closed (everything after Handshaking happens on
 * the event loop thread).
 */
class WebSocketConnection : public std::enable_shared_from_this<WebSocketConnection> {
public:
    enum class Phase { Handshaking, AwaitingSetup, Open, Closed };

    WebSocketConnection(SessionSetup setup, InboundHandler handler)
        : setup_(std::move(setup)), handler_(std::move(handler)),
          curl_(nullptr), phase_(Phase::Handshaking), abandoned_(false) {}

    ~WebSocketConnection() {
        if (handshake_thread_.joinable()) {
            if (handshake_thread_.get_id() == std::this_thread::get_id()) {
                handshake_thread_.detach();
            } else {
                abandoned_ = true;
                handshake_thread_.join();
            }
        }
        release_handle();
    }

    VoidResult prepare(const std::string& url, int connect_timeout_ms) {
        curl_ = curl_easy_init();
        if (!curl_) {
            return make_open_error("Failed to initialize CURL");
        }
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);  // WebSocket upgrade, then hand over
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms));
        curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, &WebSocketConnection::abort_check);
        curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, this);
        return {};
    }

    /// Run the blocking handshake on its own thread; the result comes back through the loop
    void start_handshake(EventLoop& loop) {
        std::shared_ptr<WebSocketConnection> self = shared_from_this();
        handshake_thread_ = std::thread([&loop, self]() {
            CURLcode rc = curl_easy_perform(self->curl_);
            loop.post([self, rc]() { self->on_handshake_done(rc); });
        });
    }

    /// Event loop: handshake thread finished
    void on_handshake_done(CURLcode rc) {
        // The thread has posted this task and is exiting
        if (handshake_thread_.joinable()) {
            handshake_thread_.join();
        }

        if (phase_ == Phase::Closed) {
            LOG_TRANSPORT("Handshake resolved after close; dropping connection");
            release_handle();
            return;
        }
        if (rc != CURLE_OK) {
            phase_ = Phase::Closed;
            release_handle();
            deliver(InboundMessage::failed(make_open_error(
                std::string("WebSocket handshake failed: ") + curl_easy_strerror(rc))));
            return;
        }

        LOG_TRANSPORT("WebSocket connected, sending setup");
        phase_ = Phase::AwaitingSetup;
        outbox_.push_back(live::encode_setup(setup_));
        auto sent = flush();
        if (!sent) {
            phase_ = Phase::Closed;
            release_handle();
            deliver(InboundMessage::failed(make_open_error("Failed to send setup: " + sent.error().message)));
        }
    }

    /**
     * @brief Queue one message and push out as much as the socket takes
     * @param droppable Refuse the message instead of queueing it behind a backlog
     */
    VoidResult send(std::string payload, bool droppable) {
        if (phase_ != Phase::Open || broken_) {
            return make_transport_error("session is not open");
        }
        if (!outbox_.empty() && droppable) {
            return make_transport_error("socket busy, message dropped");
        }
        if (outbox_.size() >= OUTBOX_MAX_MESSAGES) {
            return make_transport_error("send backlog full, message dropped");
        }
        outbox_.push_back(std::move(payload));
        auto flushed = flush();
        if (!flushed) {
            // Reported from the next poll(), outside the caller's handler
            broken_ = flushed.error();
            return flushed;
        }
        return {};
    }

    /// Stop the connection; the handshake thread (if any) is told to give up. Idempotent.
    VoidResult close() {
        if (phase_ == Phase::Closed) {
            return {};
        }
        bool was_handshaking = phase_ == Phase::Handshaking;
        phase_ = Phase::Closed;
        abandoned_ = true;
        if (was_handshaking) {
            // Curl handle still belongs to the handshake thread; on_handshake_done releases it
            return {};
        }

        VoidResult result;
        if (!broken_) {
            size_t sent = 0;
            CURLcode rc = curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
            if (rc != CURLE_OK && rc != CURLE_AGAIN) {
                result = make_transport_error(std::string("close frame failed: ") + curl_easy_strerror(rc));
            }
        }
        release_handle();
        return result;
    }

    /// Connector shutdown: make sure no thread or curl handle outlives curl_global_cleanup()
    void shutdown() {
        abandoned_ = true;
        if (handshake_thread_.joinable()) {
            handshake_thread_.join();
        }
        phase_ = Phase::Closed;
        release_handle();
    }

    void poll() {
        if (phase_ != Phase::AwaitingSetup && phase_ != Phase::Open) {
            return;
        }

        if (!broken_ && !outbox_.empty()) {
            auto flushed = flush();
            if (!flushed) {
                broken_ = flushed.error();
            }
        }
        if (broken_) {
            Error error = broken_;
            phase_ = Phase::Closed;
            release_handle();
            deliver(InboundMessage::failed(error));
            return;
        }

        char buffer[RECV_CHUNK_BYTES];
        while (phase_ == Phase::AwaitingSetup || phase_ == Phase::Open) {
            size_t received = 0;
            WsFrame* meta = nullptr;
            CURLcode rc = curl_ws_recv(curl_, buffer, sizeof(buffer), &received, &meta);
            if (rc == CURLE_AGAIN) {
                return;
            }
            if (rc == CURLE_GOT_NOTHING) {
                fail_closed("connection closed by peer");
                return;
            }
            if (rc != CURLE_OK) {
                phase_ = Phase::Closed;
                release_handle();
                deliver(InboundMessage::failed(make_transport_error(
                    std::string("receive failed: ") + curl_easy_strerror(rc))));
                return;
            }
            if (!meta) {
                continue;
            }
            if (meta->flags & CURLWS_CLOSE) {
                fail_closed(describe_close(buffer, received));
                return;
            }
            if (meta->flags & (CURLWS_PING | CURLWS_PONG)) {
                continue;
            }

            partial_.append(buffer, received);
            if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
                std::string message;
                message.swap(partial_);
                handle_message(message);
            }
        }
    }

private:
    static int abort_check(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* self = static_cast<WebSocketConnection*>(clientp);
        return self->abandoned_ ? 1 : 0;
    }

    static std::string describe_close(const char* payload, size_t size) {
        if (size < 2) {
            return "closed by server";
        }
        int code = (static_cast<unsigned char>(payload[0]) << 8) | static_cast<unsigned char>(payload[1]);
        std::ostringstream oss;
        oss << "closed by server (" << code << ")";
        if (size > 2) {
            oss << ": " << std::string(payload + 2, size - 2);
        }
        return oss.str();
    }

    void handle_message(const std::string& text) {
        auto events = live::decode_server_message(text);
        if (!events) {
            Logger::warn("[Transport] Skipping message: " + events.error().message);
            return;
        }
        for (auto& event : events.value()) {
            if (event.kind == InboundKind::SessionOpened) {
                if (phase_ != Phase::AwaitingSetup) {
                    continue;
                }
                phase_ = Phase::Open;
            }
            deliver(event);
            // The handler may have closed the session
            if (phase_ == Phase::Closed) {
                return;
            }
        }
    }

    void fail_closed(const std::string& reason) {
        phase_ = Phase::Closed;
        release_handle();
        deliver(InboundMessage::closed(reason));
    }

    void deliver(const InboundMessage& message) {
        if (handler_) {
            handler_(message);
        }
    }

    /**
     * @brief Write queued messages until the socket would block
     *
     * Never waits. A message the socket refused entirely stays queued for
     * the next poll(). A message written only in part cannot be resumed
     * without corrupting the frame stream, so it breaks the connection.
     */
    VoidResult flush() {
        while (!outbox_.empty()) {
            const std::string& head = outbox_.front();
            size_t sent = 0;
            CURLcode rc = curl_ws_send(curl_, head.data(), head.size(), &sent, 0, CURLWS_TEXT);
            if (rc == CURLE_AGAIN && sent == 0) {
                return {};
            }
            if (rc != CURLE_OK && rc != CURLE_AGAIN) {
                return make_transport_error(std::string("send failed: ") + curl_easy_strerror(rc));
            }
            if (sent < head.size()) {
                return make_transport_error("socket took " + std::to_string(sent) + " of " +
                                            std::to_string(head.size()) + " bytes of a frame");
            }
            outbox_.pop_front();
        }
        return {};
    }

    void release_handle() {
        if (curl_) {
            curl_easy_cleanup(curl_);
            curl_ = nullptr;
        }
        outbox_.clear();
    }

    SessionSetup setup_;
    InboundHandler handler_;
    CURL* curl_;
    Phase phase_;
    std::atomic<bool> abandoned_;
    std::thread handshake_thread_;
    std::string partial_;

    std::deque<std::string> outbox_;
    Error broken_;
};

namespace {

class WebSocketSession : public TransportSession {
public:
    explicit WebSocketSession(std::shared_ptr<WebSocketConnection> connection)
        : connection_(std::move(connection)) {}

    ~WebSocketSession() override {
        auto closed = connection_->close();
        if (!closed) {
            Logger::warn("[Transport] " + closed.error().message);
        }
    }

    VoidResult send_audio(const AudioChunk& chunk) override {
        return connection_->send(live::encode_audio(chunk), true);
    }

    VoidResult send_tool_responses(const std::vector<ToolResponse>& responses) override {
        return connection_->send(live::encode_tool_responses(responses), false);
    }

    VoidResult close() override {
        return connection_->close();
    }

    void poll() override {
        connection_->poll();
    }

private:
    std::shared_ptr<WebSocketConnection> connection_;
};

} // namespace

WebSocketConnector::WebSocketConnector(EventLoop& loop, const SessionConfig& config)
    : loop_(loop), config_(config) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

WebSocketConnector::~WebSocketConnector() {
    for (auto& weak : connections_) {
        if (auto connection = weak.lock()) {
            connection->shutdown();
        }
    }
    connections_.clear();
    curl_global_cleanup();
}

Result<std::unique_ptr<TransportSession>> WebSocketConnector::open(const SessionSetup& setup,
                                                                   const std::string& api_key,
                                                                   InboundHandler handler) {
    connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                      [](const std::weak_ptr<WebSocketConnection>& w) { return w.expired(); }),
                       connections_.end());

    auto connection = std::make_shared<WebSocketConnection>(setup, std::move(handler));
    auto prepared = connection->prepare(live::build_url(config_.endpoint, api_key), config_.connect_timeout_ms);
    if (!prepared) {
        return prepared.error();
    }

    LOG_TRANSPORT("Connecting to " + config_.endpoint + " (model " + setup.model + ")");
    connections_.push_back(connection);
    connection->start_handshake(loop_);
    return std::unique_ptr<TransportSession>(std::make_unique<WebSocketSession>(connection));
}

} // namespace transport
} // namespace calcvox
