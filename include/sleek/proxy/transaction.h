#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sleek::proxy {

enum class TransactionStage {
    Received,
    Validated,
    Authorized,
    Fetched,
    Classified,
    Rewritten,
    PassedThrough,
    Responded,
    RejectedValidation,
    RejectedGuard,
    UpstreamFailed,
    InternalError,
};

const char* transaction_stage_name(TransactionStage stage);

bool is_terminal_failure(TransactionStage stage);

// HTTP status a terminal failure stage maps to, 0 for other stages
int failure_status(TransactionStage stage);

struct StageRecord {
    TransactionStage stage;
    std::chrono::steady_clock::time_point entered_at;
    double elapsed_since_prev_ms = 0.0;
    std::string detail;
};

// Ordered record of one proxied request. Stages only move forward; an
// attempt to revisit or skip backwards is refused.
class ProxyTransaction {
public:
    ProxyTransaction();

    // false (and nothing recorded) when the move is not allowed
    bool advance(TransactionStage stage, std::string detail = {});

    TransactionStage current() const;
    bool failed() const;

    const std::vector<StageRecord>& records() const { return records_; }

    static bool can_transition(TransactionStage from, TransactionStage to);

private:
    std::vector<StageRecord> records_;
};

} // namespace sleek::proxy
