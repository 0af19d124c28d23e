#include "history_log.h"

namespace calcvox {

std::string CalculationLog::to_string() const {
    return expression + " = " + result;
}

HistoryLog::HistoryLog(size_t limit)
    : limit_(limit == 0 ? 1 : limit) {
}

void HistoryLog::push_front(CalculationLog entry) {
    entries_.push_front(std::move(entry));
    while (entries_.size() > limit_) {
        entries_.pop_back();
    }
}

void HistoryLog::clear() {
    entries_.clear();
}

std::vector<std::string> HistoryLog::latest(size_t count) const {
    std::vector<std::string> lines;
    for (size_t i = 0; i < entries_.size() && i < count; ++i) {
        lines.push_back(entries_[i].to_string());
    }
    return lines;
}

} // namespace calcvox
