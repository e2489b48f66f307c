#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

struct HttpRequest {
    std::string url;
    // When set, a "Range: bytes=<start>-" header is sent.
    std::optional<std::uint64_t> range_start;
    // Bound for every single step: resolve, connect, handshake, response
    // header and each body read. A transfer that keeps delivering never hits it.
    std::chrono::milliseconds timeout{std::chrono::seconds(15)};
    // Optional cap on the whole exchange, connect to last body byte.
    std::optional<std::chrono::milliseconds> total_timeout;
};

// Receives body fragments as they arrive. Returning false aborts the transfer.
using HttpDataCallback = std::function<bool(const char* data, std::size_t size)>;

// Streaming GET. Returns the HTTP status. The body is only delivered for 2xx
// responses. Throws NetworkError(0, ...) when no response could be read and
// TimeoutError when a step stalls past timeout or the exchange outlasts
// total_timeout.
class IHttpClient {
  public:
    virtual ~IHttpClient() = default;
    virtual int get(const HttpRequest& request, const HttpDataCallback& on_data) = 0;
};

#endif // HTTPCLIENT_H
