#include <sleek/proxy/transaction.h>

namespace sleek::proxy {

const char* transaction_stage_name(TransactionStage stage) {
    switch (stage) {
        case TransactionStage::Received:           return "received";
        case TransactionStage::Validated:          return "validated";
        case TransactionStage::Authorized:         return "authorized";
        case TransactionStage::Fetched:            return "fetched";
        case TransactionStage::Classified:         return "classified";
        case TransactionStage::Rewritten:          return "rewritten";
        case TransactionStage::PassedThrough:      return "passed-through";
        case TransactionStage::Responded:          return "responded";
        case TransactionStage::RejectedValidation: return "rejected-validation";
        case TransactionStage::RejectedGuard:      return "rejected-guard";
        case TransactionStage::UpstreamFailed:     return "upstream-failed";
        case TransactionStage::InternalError:      return "internal-error";
    }
    return "unknown";
}

bool is_terminal_failure(TransactionStage stage) {
    return failure_status(stage) != 0;
}

int failure_status(TransactionStage stage) {
    switch (stage) {
        case TransactionStage::RejectedValidation: return 400;
        case TransactionStage::RejectedGuard:      return 403;
        case TransactionStage::UpstreamFailed:     return 502;
        case TransactionStage::InternalError:      return 500;
        default:                                   return 0;
    }
}

bool ProxyTransaction::can_transition(TransactionStage from, TransactionStage to) {
    using S = TransactionStage;
    if (is_terminal_failure(from) || from == S::Responded) {
        return false;
    }
    // Any live stage may fail internally
    if (to == S::InternalError) {
        return true;
    }
    switch (from) {
        case S::Received:      return to == S::Validated || to == S::RejectedValidation;
        case S::Validated:     return to == S::Authorized || to == S::RejectedGuard;
        case S::Authorized:    return to == S::Fetched || to == S::UpstreamFailed;
        case S::Fetched:       return to == S::Classified || to == S::UpstreamFailed;
        case S::Classified:    return to == S::Rewritten || to == S::PassedThrough ||
                                      to == S::UpstreamFailed;
        case S::Rewritten:
        case S::PassedThrough: return to == S::Responded;
        default:               return false;
    }
}

ProxyTransaction::ProxyTransaction() {
    records_.push_back(StageRecord{TransactionStage::Received,
                                   std::chrono::steady_clock::now(), 0.0, {}});
}

bool ProxyTransaction::advance(TransactionStage stage, std::string detail) {
    if (!can_transition(current(), stage)) {
        return false;
    }

    StageRecord record{stage, std::chrono::steady_clock::now(), 0.0, std::move(detail)};
    const auto delta = record.entered_at - records_.back().entered_at;
    record.elapsed_since_prev_ms = std::chrono::duration<double, std::milli>(delta).count();
    records_.push_back(std::move(record));
    return true;
}

TransactionStage ProxyTransaction::current() const {
    return records_.back().stage;
}

bool ProxyTransaction::failed() const {
    return is_terminal_failure(current());
}

} // namespace sleek::proxy
