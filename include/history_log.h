#pragma once

#include "common.h"
#include <deque>
#include <string>
#include <vector>

namespace calcvox {

/**
 * @brief One finished calculation
 */
struct CalculationLog {
    std::string expression;
    std::string result;
    int64_t timestamp_ms = 0;

    /// "<expression> = <result>"
    std::string to_string() const;
};

/**
 * @brief Most-recent-first list of calculations, bounded to HISTORY_LIMIT
 */
class HistoryLog {
public:
    explicit HistoryLog(size_t limit = HISTORY_LIMIT);

    /// Insert at the head; the oldest entry is evicted past the limit
    void push_front(CalculationLog entry);

    void clear();

    const std::deque<CalculationLog>& entries() const { return entries_; }

    /// Up to count newest entries rendered with CalculationLog::to_string()
    std::vector<std::string> latest(size_t count) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    size_t limit() const { return limit_; }

private:
    std::deque<CalculationLog> entries_;
    size_t limit_;
};

} // namespace calcvox
