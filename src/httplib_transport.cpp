#include "agentgate/httplib_transport.hpp"
#include "agentgate/exceptions.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace agentgate {

namespace {

std::unique_ptr<httplib::Client> make_client(const std::string& origin, Duration timeout,
                                             bool verify_certificates) {
    auto cli = std::make_unique<httplib::Client>(origin);
    if (!cli->is_valid()) {
        throw TransportException("Unsupported endpoint " + origin);
    }
    cli->set_connection_timeout(timeout);
    cli->set_read_timeout(timeout);
    cli->set_write_timeout(timeout);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    cli->enable_server_certificate_verification(verify_certificates);
#else
    (void)verify_certificates;
#endif
    return cli;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

HttplibTransport::HttplibTransport(bool verify_certificates)
    : verify_certificates_(verify_certificates) {}

HttplibTransport::Target HttplibTransport::split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw TransportException("URL has no scheme: " + url);
    }
    auto path_start = url.find('/', scheme_end + 3);
    Target target;
    target.origin = url.substr(0, path_start);
    target.path = path_start == std::string::npos ? "/" : url.substr(path_start);
    if (target.origin.size() == scheme_end + 3) {
        throw TransportException("URL has no host: " + url);
    }
    return target;
}

HttpResponse HttplibTransport::send(const HttpRequest& request) {
    if (request.timeout <= Duration::zero()) {
        return HttpResponse{0, "", true};
    }
    auto target = split_url(request.url);
    auto cli = make_client(target.origin, request.timeout, verify_certificates_);

    httplib::Headers headers;
    std::string content_type = "application/json";
    for (auto& [name, value] : request.headers) {
        if (iequals(name, "Content-Type")) {
            content_type = value;
        } else {
            headers.emplace(name, value);
        }
    }

    if (request.method != "POST" && request.method != "GET") {
        throw TransportException("Unsupported method " + request.method);
    }

    const auto started = Clock::now();
    auto res = request.method == "POST"
        ? cli->Post(target.path, headers, request.body, content_type)
        : cli->Get(target.path, headers);

    if (!res) {
        if (Clock::now() - started >= request.timeout) {
            return HttpResponse{0, "", true};
        }
        throw TransportException(httplib::to_string(res.error()));
    }
    return HttpResponse{res->status, res->body, false};
}

} // namespace agentgate
