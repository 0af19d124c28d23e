#pragma once

#include "common.h"
#include "history_log.h"
#include "state_machine.h"
#include <functional>
#include <string>

namespace calcvox {

/**
 * @brief Everything the presentation surface shows
 *
 * Written from the event loop only (controller, accumulator, tool
 * dispatcher). A single listener is told which field changed so a front end
 * can redraw.
 */
class DisplayModel {
public:
    enum class Field {
        Expression,
        Result,
        History,
        Connection
    };

    using Listener = std::function<void(Field)>;

    DisplayModel();

    const std::string& expression() const { return expression_; }
    const std::string& result() const { return result_; }
    const HistoryLog& history() const { return history_; }
    ConnectionState connection_state() const { return connection_state_; }

    void set_expression(const std::string& text);
    void set_result(const std::string& text);
    void add_history(CalculationLog entry);
    void clear_history();
    void set_connection_state(ConnectionState state);

    /// Neutral result, empty expression, empty history
    void reset();

    void set_listener(Listener listener) { listener_ = std::move(listener); }

private:
    void notify(Field field);

    std::string expression_;
    std::string result_;
    HistoryLog history_;
    ConnectionState connection_state_;
    Listener listener_;
};

const char* to_string(DisplayModel::Field field);

} // namespace calcvox
