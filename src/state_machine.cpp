#include "state_machine.h"

namespace calcvox {

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Error: return "Error";
    }
    return "Unknown";
}

class ConnectionStateMachine::Impl {
public:
    Impl() : state_(ConnectionState::Disconnected) {}

    ConnectionState get_state() const {
        return state_;
    }

    bool on_connect_requested() {
        if (state_ != ConnectionState::Disconnected) {
            return false;
        }
        transition(ConnectionState::Connecting);
        return true;
    }

    bool on_remote_open() {
        if (state_ != ConnectionState::Connecting) {
            return false;
        }
        transition(ConnectionState::Connected);
        return true;
    }

    void on_failure() {
        transition(ConnectionState::Error);
    }

    void on_teardown_complete() {
        transition(ConnectionState::Disconnected);
    }

    void set_listener(Listener listener) {
        listener_ = std::move(listener);
    }

private:
    void transition(ConnectionState next) {
        if (next == state_) {
            return;
        }
        ConnectionState previous = state_;
        state_ = next;
        if (listener_) {
            listener_(previous, next);
        }
    }

    ConnectionState state_;
    Listener listener_;
};

ConnectionStateMachine::ConnectionStateMachine() : pimpl_(std::make_unique<Impl>()) {}
ConnectionStateMachine::~ConnectionStateMachine() = default;

ConnectionState ConnectionStateMachine::get_state() const {
    return pimpl_->get_state();
}

bool ConnectionStateMachine::on_connect_requested() {
    return pimpl_->on_connect_requested();
}

bool ConnectionStateMachine::on_remote_open() {
    return pimpl_->on_remote_open();
}

void ConnectionStateMachine::on_failure() {
    pimpl_->on_failure();
}

void ConnectionStateMachine::on_teardown_complete() {
    pimpl_->on_teardown_complete();
}

bool ConnectionStateMachine::is_connected() const {
    return pimpl_->get_state() == ConnectionState::Connected;
}

void ConnectionStateMachine::set_listener(Listener listener) {
    pimpl_->set_listener(std::move(listener));
}

} // namespace calcvox
