// Abstract interface for HTTP retrieval. Concrete implementations (e.g., libcurl)
// must follow this API to keep workers and UI decoupled from the backend.
#pragma once
#include "Types.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace mediagrab {

class HttpClient {
public:
    // Called once, after the final response headers of a 2xx response and before
    // any body byte. contentLength is 0 when the server does not report it.
    using ResponseCB = std::function<bool(std::uint64_t /*contentLength*/)>;
    // Called for every received chunk. Returning false aborts the transfer.
    using DataCB = std::function<bool(const char* /*data*/, std::size_t /*size*/)>;
    // Polled while the transfer waits on the network. Returning true aborts it,
    // even when no data is arriving.
    using CancelCB = std::function<bool()>;

    virtual ~HttpClient() = default;

    // Streaming GET. Implementations must be safe to call from several threads.
    // On failure fills err and kind (Network or HttpStatus). An abort requested
    // by a callback returns false and leaves kind as None.
    virtual bool get(const std::string& url,
                     std::string& err,
                     ErrorKind& kind,
                     ResponseCB onResponse,
                     DataCB onData,
                     CancelCB shouldCancel = {}) = 0;

    // Fetch a whole document as text (page retrieval for link discovery).
    virtual bool fetchText(const std::string& url,
                           std::string& out,
                           std::string& err) = 0;
};

} // namespace mediagrab
