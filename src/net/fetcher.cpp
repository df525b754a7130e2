#include <sleek/net/fetcher.h>

namespace sleek::net {

const char* fetch_error_name(FetchError error) {
    switch (error) {
        case FetchError::None:           return "none";
        case FetchError::InvalidRequest: return "invalid request";
        case FetchError::ConnectFailed:  return "connect failed";
        case FetchError::TlsFailed:      return "tls failed";
        case FetchError::Timeout:        return "timeout";
        case FetchError::Cancelled:      return "cancelled";
        case FetchError::BadResponse:    return "bad response";
    }
    return "unknown";
}

FetchOutcome FetchOutcome::failure(FetchError error, std::string message) {
    FetchOutcome outcome;
    outcome.ok = false;
    outcome.error = error;
    outcome.message = std::move(message);
    return outcome;
}

FetchOutcome FetchOutcome::success(Response head, std::unique_ptr<BodyStream> body) {
    FetchOutcome outcome;
    outcome.ok = true;
    outcome.reply.head = std::move(head);
    outcome.reply.body = body ? std::move(body)
                              : std::make_unique<MemoryBodyStream>(std::vector<uint8_t>{});
    return outcome;
}

} // namespace sleek::net
