#pragma once

#include <httplib.h>

#include <string>

namespace updown {

// Per-route handler pair. A verb without a handler answers 405.
struct ByMethod {
    httplib::Server::Handler get;
    httplib::Server::HandlerWithContentReader post;
};

class MethodRouter {
public:
    explicit MethodRouter(ByMethod handlers);

    void dispatch(const httplib::Request& req, httplib::Response& res,
        const httplib::ContentReader* reader) const;

    // Registers the router for every verb on `pattern`.
    void mount(httplib::Server& svr, const std::string& pattern) const;

private:
    ByMethod handlers_;
};

}  // namespace updown
