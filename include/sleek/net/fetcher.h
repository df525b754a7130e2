#pragma once
#include <sleek/net/body_stream.h>
#include <sleek/net/request.h>
#include <sleek/net/response.h>
#include <memory>
#include <string>

namespace sleek::net {

enum class FetchError {
    None,
    InvalidRequest,
    ConnectFailed,
    TlsFailed,
    Timeout,
    Cancelled,
    BadResponse,
};

const char* fetch_error_name(FetchError error);

struct UpstreamReply {
    Response head;
    // Never null on success; yields nothing for bodiless responses
    std::unique_ptr<BodyStream> body;
};

struct FetchOutcome {
    bool ok = false;
    FetchError error = FetchError::None;
    std::string message;
    UpstreamReply reply;

    static FetchOutcome failure(FetchError error, std::string message);
    static FetchOutcome success(Response head, std::unique_ptr<BodyStream> body);
};

// The "perform HTTP fetch" capability. Implementations must be safe to call
// from several worker threads at once.
class Fetcher {
public:
    virtual ~Fetcher() = default;
    virtual FetchOutcome fetch(const Request& request) const = 0;
};

} // namespace sleek::net
