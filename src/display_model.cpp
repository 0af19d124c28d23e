#include "display_model.h"

namespace calcvox {

const char* to_string(DisplayModel::Field field) {
    switch (field) {
        case DisplayModel::Field::Expression: return "expression";
        case DisplayModel::Field::Result: return "result";
        case DisplayModel::Field::History: return "history";
        case DisplayModel::Field::Connection: return "connection";
    }
    return "unknown";
}

DisplayModel::DisplayModel()
    : result_(INITIAL_RESULT_TEXT),
      history_(HISTORY_LIMIT),
      connection_state_(ConnectionState::Disconnected) {
}

void DisplayModel::set_expression(const std::string& text) {
    if (expression_ == text) return;
    expression_ = text;
    notify(Field::Expression);
}

void DisplayModel::set_result(const std::string& text) {
    if (result_ == text) return;
    result_ = text;
    notify(Field::Result);
}

void DisplayModel::add_history(CalculationLog entry) {
    history_.push_front(std::move(entry));
    notify(Field::History);
}

void DisplayModel::clear_history() {
    if (history_.empty()) return;
    history_.clear();
    notify(Field::History);
}

void DisplayModel::set_connection_state(ConnectionState state) {
    if (connection_state_ == state) return;
    connection_state_ = state;
    notify(Field::Connection);
}

void DisplayModel::reset() {
    set_result(NEUTRAL_RESULT_TEXT);
    set_expression("");
    clear_history();
}

void DisplayModel::notify(Field field) {
    if (listener_) {
        listener_(field);
    }
}

} // namespace calcvox
