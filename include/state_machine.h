#pragma once

#include <memory>
#include <functional>

namespace calcvox {

/**
 * @brief Connection state of the voice session
 */
enum class ConnectionState {
    Disconnected,   ///< No session; connect() allowed
    Connecting,     ///< Devices acquired, waiting for the remote "open"
    Connected,      ///< Session open, capture streaming
    Error           ///< Failure observed; teardown in progress
};

const char* to_string(ConnectionState state);

/**
 * @brief Connection lifecycle state machine
 *
 * - Disconnected -> Connecting (on_connect_requested)
 * - Connecting -> Connected (on_remote_open)
 * - Connected/Connecting -> Disconnected (on_teardown_complete)
 * - any -> Error (on_failure); Error -> Disconnected (on_teardown_complete)
 *
 * Error is transient: the owner always runs teardown after on_failure,
 * which settles the machine at Disconnected.
 */
class ConnectionStateMachine {
public:
    using Listener = std::function<void(ConnectionState previous, ConnectionState current)>;

    ConnectionStateMachine();
    ~ConnectionStateMachine();

    ConnectionState get_state() const;

    /**
     * @brief Request a new connection
     * @return False (and no transition) unless currently Disconnected
     */
    bool on_connect_requested();

    /**
     * @brief Remote side acknowledged the session
     * @return False unless currently Connecting
     */
    bool on_remote_open();

    /// Unrecoverable failure from any state
    void on_failure();

    /// Cleanup finished; always lands in Disconnected
    void on_teardown_complete();

    bool is_connected() const;

    /// Observer notified after every actual state change
    void set_listener(Listener listener);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace calcvox
