#pragma once

#include "agentgate/provider.hpp"

#include <string>

namespace agentgate {

// HttpTransport over cpp-httplib. One client per call; connect, read and
// write timeouts all follow HttpRequest::timeout. A call that runs out its
// timeout comes back timed_out, any other failure to get a response
// throws TransportException.
class HttplibTransport : public HttpTransport {
public:
    explicit HttplibTransport(bool verify_certificates = true);

    HttpResponse send(const HttpRequest& request) override;

    // Splits "scheme://host[:port]/path?query" into origin and path.
    // Throws TransportException when the URL has no scheme or host.
    struct Target {
        std::string origin;
        std::string path;
    };
    static Target split_url(const std::string& url);

private:
    bool verify_certificates_;
};

} // namespace agentgate
